#include "crypto/checksum.hpp"
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace shardpack::crypto {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

//==============================================
// DIGEST OPERATIONS
//==============================================

Digest Checksum::digest(const Bytes& data) const {
  return digest(data.data(), data.size());
}

Digest Checksum::digest(const std::string& data) const {
  return digest(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Digest Checksum::digest(const uint8_t* data, size_t size) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  // Create a new message digest context for the hashing operation
  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw ChecksumError("Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw ChecksumError("Failed to initialize hash context");
  }

  if (size > 0 && !EVP_DigestUpdate(ctx.get(), data, size)) {
    throw ChecksumError("Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
    throw ChecksumError("Failed to finalize hash");
  }

  Digest result = to_hex(hash, hash_len);
  BOOST_LOG_TRIVIAL(trace) << "Checksum: " << size << " bytes -> " << result;
  return result;
}

bool Checksum::equal(const Digest& lhs, const Digest& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}


//==============================================
// HEX ENCODING
//==============================================

std::string to_hex(const uint8_t* data, size_t size) {
  std::stringstream ss;
  for (size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') 
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

std::string to_hex(const Bytes& data) {
  return to_hex(data.data(), data.size());
}

Bytes from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("Invalid hex string length");
  }

  Bytes result;
  result.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int high = hex_value(hex[i]);
    int low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) {
      throw std::invalid_argument("Invalid hex character");
    }
    result.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return result;
}

} // namespace shardpack::crypto
