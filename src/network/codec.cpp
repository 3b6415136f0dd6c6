#include "network/codec.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>
#include <sstream>

namespace fts {
namespace network {

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::size_t Codec::serialize(const Message& message, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw CodecError("Codec: Invalid output stream");
  }

  MessageType type = message_type(message);
  std::string body = encode_body(message);
  if (body.size() > MAX_BODY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Message body of " << body.size() << " bytes exceeds frame limit";
    throw CodecError("Codec: Message body too large");
  }

  // Write message type
  uint8_t msg_type = static_cast<uint8_t>(type);
  write_bytes(output, &msg_type, sizeof(msg_type));

  // Write body length in network byte order
  uint32_t network_body_length = to_network_order(static_cast<uint32_t>(body.size()));
  write_bytes(output, &network_body_length, sizeof(network_body_length));

  write_bytes(output, body.data(), body.size());
  output.flush();

  std::size_t total_bytes = HEADER_SIZE + body.size();
  BOOST_LOG_TRIVIAL(debug) << "Codec: Serialized " << message_type_to_string(type)
                           << " frame, total bytes written: " << total_bytes;
  return total_bytes;
}

Message Codec::deserialize(std::istream& input) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw CodecError("Codec: Invalid input stream");
  }

  uint8_t header[HEADER_SIZE];
  read_bytes(input, header, sizeof(header));

  MessageType type = static_cast<MessageType>(header[0]);
  uint32_t body_length = parse_body_length(header);

  std::string body(body_length, '\0');
  if (body_length > 0) {
    read_bytes(input, &body[0], body_length);
  }

  Message message = decode_body(type, body);
  BOOST_LOG_TRIVIAL(debug) << "Codec: Deserialized " << message_type_to_string(type)
                           << " frame with body of " << body_length << " bytes";
  return message;
}

uint32_t Codec::parse_body_length(const uint8_t* header) {
  uint32_t network_body_length;
  std::memcpy(&network_body_length, header + sizeof(uint8_t), sizeof(network_body_length));
  uint32_t body_length = from_network_order(network_body_length);

  if (body_length > MAX_BODY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Frame body length " << body_length << " exceeds limit of " << MAX_BODY_SIZE;
    throw CodecError("Codec: Frame body too large");
  }
  return body_length;
}


//==============================================
// BODY ENCODING
//==============================================

std::string Codec::encode_body(const Message& message) {
  std::ostringstream body;

  switch (message_type(message)) {
    case MessageType::EMPTY:
      break;
    case MessageType::STORAGE_REQUEST: {
      const auto& request = std::get<StorageRequest>(message);
      write_string(body, request.file_name);
      write_uint64(body, request.size);
      break;
    }
    case MessageType::RETRIEVAL_REQUEST:
      write_string(body, std::get<RetrievalRequest>(message).file_name);
      break;
    case MessageType::RESPONSE: {
      const auto& response = std::get<Response>(message);
      write_bool(body, response.ok);
      write_string(body, response.message);
      break;
    }
    case MessageType::RETRIEVAL_RESPONSE: {
      const auto& response = std::get<RetrievalResponse>(message);
      write_bool(body, response.ok);
      write_string(body, response.message);
      write_uint64(body, response.size);
      break;
    }
    case MessageType::CHECKSUM_VERIFICATION: {
      const auto& checksum = std::get<ChecksumVerification>(message).checksum;
      write_string(body, std::string(checksum.begin(), checksum.end()));
      break;
    }
  }

  return body.str();
}

Message Codec::decode_body(MessageType type, const std::string& body) {
  std::istringstream input(body);
  Message message;

  switch (type) {
    case MessageType::EMPTY:
      break;
    case MessageType::STORAGE_REQUEST: {
      StorageRequest request;
      request.file_name = read_string(input);
      request.size = read_uint64(input);
      message = std::move(request);
      break;
    }
    case MessageType::RETRIEVAL_REQUEST: {
      RetrievalRequest request;
      request.file_name = read_string(input);
      message = std::move(request);
      break;
    }
    case MessageType::RESPONSE: {
      Response response;
      response.ok = read_bool(input);
      response.message = read_string(input);
      message = std::move(response);
      break;
    }
    case MessageType::RETRIEVAL_RESPONSE: {
      RetrievalResponse response;
      response.ok = read_bool(input);
      response.message = read_string(input);
      response.size = read_uint64(input);
      message = std::move(response);
      break;
    }
    case MessageType::CHECKSUM_VERIFICATION: {
      std::string checksum = read_string(input);
      message = ChecksumVerification{std::vector<uint8_t>(checksum.begin(), checksum.end())};
      break;
    }
    default:
      BOOST_LOG_TRIVIAL(error) << "Codec: Unknown message type: " << static_cast<int>(type);
      throw CodecError("Codec: Unknown message type");
  }

  if (input.peek() != std::char_traits<char>::eof()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Trailing bytes after " << message_type_to_string(type) << " body";
    throw CodecError("Codec: Trailing bytes in frame body");
  }

  return message;
}


//==============================================
// STREAM OPERATIONS
//==============================================

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw CodecError("Codec: Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to read " << size << " bytes from input stream";
    throw CodecError("Codec: Failed to read from input stream");
  }
}

void Codec::write_bool(std::ostream& output, bool value) {
  uint8_t byte = value ? 1 : 0;
  write_bytes(output, &byte, sizeof(byte));
}

void Codec::write_uint64(std::ostream& output, uint64_t value) {
  uint64_t network_value = to_network_order(value);
  write_bytes(output, &network_value, sizeof(network_value));
}

void Codec::write_string(std::ostream& output, const std::string& value) {
  uint32_t network_length = to_network_order(static_cast<uint32_t>(value.size()));
  write_bytes(output, &network_length, sizeof(network_length));
  write_bytes(output, value.data(), value.size());
}

bool Codec::read_bool(std::istream& input) {
  uint8_t byte;
  read_bytes(input, &byte, sizeof(byte));
  if (byte > 1) {
    throw CodecError("Codec: Invalid boolean value");
  }
  return byte == 1;
}

uint64_t Codec::read_uint64(std::istream& input) {
  uint64_t network_value;
  read_bytes(input, &network_value, sizeof(network_value));
  return from_network_order(network_value);
}

std::string Codec::read_string(std::istream& input) {
  uint32_t network_length;
  read_bytes(input, &network_length, sizeof(network_length));
  uint32_t length = from_network_order(network_length);

  // A field can never be longer than the frame body that contains it
  if (length > MAX_BODY_SIZE) {
    throw CodecError("Codec: String field too long");
  }

  std::string value(length, '\0');
  if (length > 0) {
    read_bytes(input, &value[0], length);
  }
  return value;
}

} // namespace network
} // namespace fts
