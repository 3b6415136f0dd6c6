#ifndef FTS_NETWORK_MESSAGE_HPP
#define FTS_NETWORK_MESSAGE_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace fts {
namespace network {

// Message type used to differentiate between frames on the wire
enum class MessageType : uint8_t {
    EMPTY = 0,
    STORAGE_REQUEST = 1,
    RETRIEVAL_REQUEST = 2,
    RESPONSE = 3,
    RETRIEVAL_RESPONSE = 4,
    CHECKSUM_VERIFICATION = 5
};

// Client asks the server to store `size` bytes under `file_name`
struct StorageRequest {
    std::string file_name;
    uint64_t size{0};
};

// Client asks the server to send back `file_name`
struct RetrievalRequest {
    std::string file_name;
};

// Generic status response
struct Response {
    bool ok{false};
    std::string message;
};

// Retrieval readiness, announces the number of payload bytes that follow
struct RetrievalResponse {
    bool ok{false};
    std::string message;
    uint64_t size{0};
};

// Digest of a payload, sent once the payload bytes are through
struct ChecksumVerification {
    std::vector<uint8_t> checksum;
};

// Tagged union of every message kind. std::monostate is the empty message.
using Message = std::variant<std::monostate,
                             StorageRequest,
                             RetrievalRequest,
                             Response,
                             RetrievalResponse,
                             ChecksumVerification>;

MessageType message_type(const Message& message);
const char* message_type_to_string(MessageType type);

} // namespace network
} // namespace fts

#endif // FTS_NETWORK_MESSAGE_HPP
