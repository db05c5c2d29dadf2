#ifndef SHARDPACK_CRYPTO_ERROR_HPP
#define SHARDPACK_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace shardpack::crypto {

class CryptoError : public std::runtime_error {
public:
  explicit CryptoError(const std::string& message)
    : std::runtime_error(message) {}
};

class InitializationError : public CryptoError {
public:
  explicit InitializationError(const std::string& message)
    : CryptoError("Initialization error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
  explicit EncryptionError(const std::string& message)
    : CryptoError("Encryption error: " + message) {}
};

// Wrong key, unknown algorithm or failed authentication tag
class DecryptionError : public CryptoError {
public:
  explicit DecryptionError(const std::string& message)
    : CryptoError("Decryption error: " + message) {}
};

class ChecksumError : public CryptoError {
public:
  explicit ChecksumError(const std::string& message)
    : CryptoError("Checksum error: " + message) {}
};

} // namespace shardpack::crypto

#endif // SHARDPACK_CRYPTO_ERROR_HPP
