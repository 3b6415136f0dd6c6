#ifndef FTS_NETWORK_CODEC_HPP
#define FTS_NETWORK_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <boost/endian/conversion.hpp>
#include "network/message.hpp"

namespace fts {
namespace network {

class CodecError : public std::runtime_error {
public:
  explicit CodecError(const std::string& message) : std::runtime_error(message) {}
};

// Frame layout: [type:1][body_length:4, big endian][body]
class Codec {
public:
  static constexpr std::size_t HEADER_SIZE = sizeof(uint8_t) + sizeof(uint32_t);
  static constexpr uint32_t MAX_BODY_SIZE = 1024 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Codec() = default;


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a message as one frame, returns the number of bytes written
  std::size_t serialize(const Message& message, std::ostream& output);
  // Reads exactly one frame from the input stream
  Message deserialize(std::istream& input);

  // Extracts the body length from a raw frame header and validates it
  static uint32_t parse_body_length(const uint8_t* header);

private:
  // ---- BODY ENCODING ----
  std::string encode_body(const Message& message);
  Message decode_body(MessageType type, const std::string& body);


  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  void write_bytes(std::ostream& output, const void* data, std::size_t size);
  // Reads bytes from an input stream
  void read_bytes(std::istream& input, void* data, std::size_t size);

  void write_bool(std::ostream& output, bool value);
  void write_uint64(std::ostream& output, uint64_t value);
  void write_string(std::ostream& output, const std::string& value);
  bool read_bool(std::istream& input);
  uint64_t read_uint64(std::istream& input);
  std::string read_string(std::istream& input);


  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  static uint32_t to_network_order(uint32_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint64_t to_network_order(uint64_t host_value) {
    return boost::endian::native_to_big(host_value);
  }


  // ---- NETWORK TO HOST BYTE ORDER CONVERSION ----
  static uint32_t from_network_order(uint32_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
  static uint64_t from_network_order(uint64_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace network
} // namespace fts

#endif // FTS_NETWORK_CODEC_HPP
