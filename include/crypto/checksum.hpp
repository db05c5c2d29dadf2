#ifndef SHARDPACK_CRYPTO_CHECKSUM_HPP
#define SHARDPACK_CRYPTO_CHECKSUM_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include "common/types.hpp"
#include "crypto/crypto_error.hpp"

namespace shardpack::crypto {

class Checksum {
public:
  static constexpr size_t DIGEST_SIZE = 32;    // SHA-256
  static constexpr const char* ALGORITHM = "sha-256";

  // ---- DIGEST OPERATIONS ----
  // Computes the lowercase hex SHA-256 of the given bytes using OpenSSL EVP
  Digest digest(const Bytes& data) const;
  Digest digest(const uint8_t* data, size_t size) const;
  Digest digest(const std::string& data) const;

  // Compares two digests without early exit on the first differing byte
  static bool equal(const Digest& lhs, const Digest& rhs);
};


// ---- HEX ENCODING ----
std::string to_hex(const uint8_t* data, size_t size);
std::string to_hex(const Bytes& data);
// Throws std::invalid_argument on odd length or non-hex characters
Bytes from_hex(const std::string& hex);

} // namespace shardpack::crypto

#endif // SHARDPACK_CRYPTO_CHECKSUM_HPP
