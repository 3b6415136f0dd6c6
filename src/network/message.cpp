#include "network/message.hpp"

namespace fts {
namespace network {

MessageType message_type(const Message& message) {
  switch (message.index()) {
    case 1: return MessageType::STORAGE_REQUEST;
    case 2: return MessageType::RETRIEVAL_REQUEST;
    case 3: return MessageType::RESPONSE;
    case 4: return MessageType::RETRIEVAL_RESPONSE;
    case 5: return MessageType::CHECKSUM_VERIFICATION;
    default: return MessageType::EMPTY;
  }
}

const char* message_type_to_string(MessageType type) {
  switch (type) {
    case MessageType::EMPTY: return "Empty";
    case MessageType::STORAGE_REQUEST: return "StorageRequest";
    case MessageType::RETRIEVAL_REQUEST: return "RetrievalRequest";
    case MessageType::RESPONSE: return "Response";
    case MessageType::RETRIEVAL_RESPONSE: return "RetrievalResponse";
    case MessageType::CHECKSUM_VERIFICATION: return "ChecksumVerification";
    default: return "Unknown";
  }
}

} // namespace network
} // namespace fts
