#include "checksum/checksum.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace fts::checksum {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  // Create and initialize a new MD5 digest context
  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw ChecksumError("Checksum: Failed to create digest context");
    }
    if (!EVP_DigestInit_ex(ctx, EVP_md5(), nullptr)) {
      EVP_MD_CTX_free(ctx);
      throw ChecksumError("Checksum: Failed to initialize digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Checksum::Checksum() 
  : context_(std::make_unique<DigestContext>()) {
}

Checksum::~Checksum() = default;


//==============================================
// DIGEST OPERATIONS
//==============================================

void Checksum::update(const void* data, size_t size) {
  if (finalized_) {
    throw ChecksumError("Checksum: Update after finalize");
  }
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    BOOST_LOG_TRIVIAL(error) << "Checksum: Digest update of " << size << " bytes failed";
    throw ChecksumError("Checksum: Failed to update digest");
  }
}

std::vector<uint8_t> Checksum::finalize() {
  if (finalized_) {
    throw ChecksumError("Checksum: Digest already finalized");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), digest, &digest_len)) {
    throw ChecksumError("Checksum: Failed to finalize digest");
  }
  finalized_ = true;

  return std::vector<uint8_t>(digest, digest + digest_len);
}

std::vector<uint8_t> Checksum::compute(const std::string& data) {
  Checksum checksum;
  checksum.update(data.data(), data.size());
  return checksum.finalize();
}


//==============================================
// CHECKSUM UTILITIES
//==============================================

bool verify_checksum(const std::vector<uint8_t>& expected, const std::vector<uint8_t>& actual) {
  return expected == actual;
}

std::string to_hex(const std::vector<uint8_t>& checksum) {
  std::stringstream ss;
  for (uint8_t byte : checksum) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace fts::checksum
