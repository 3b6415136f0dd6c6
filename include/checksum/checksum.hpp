#ifndef FTS_CHECKSUM_HPP
#define FTS_CHECKSUM_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "checksum_error.hpp"

namespace fts::checksum {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Running MD5 digest fed incrementally while a payload is streamed
class Checksum {
public:
  static constexpr size_t DIGEST_SIZE = 16;  // 128 bits for MD5

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Checksum();
  ~Checksum();

  Checksum(const Checksum&) = delete;
  Checksum& operator=(const Checksum&) = delete;


  // ---- DIGEST OPERATIONS ----
  // Feeds bytes into the running digest
  void update(const void* data, size_t size);
  // Returns the digest of everything fed so far. The accumulator cannot be
  // updated afterwards.
  std::vector<uint8_t> finalize();

  // One-shot digest of a buffer
  static std::vector<uint8_t> compute(const std::string& data);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};


// ---- CHECKSUM UTILITIES ----
// Byte-exact comparison of two checksums
bool verify_checksum(const std::vector<uint8_t>& expected, const std::vector<uint8_t>& actual);
// Lowercase hexadecimal rendering for logs
std::string to_hex(const std::vector<uint8_t>& checksum);

} // namespace fts::checksum

#endif // FTS_CHECKSUM_HPP
