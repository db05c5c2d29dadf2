#ifndef SHARDPACK_CRYPTO_CIPHER_HPP
#define SHARDPACK_CRYPTO_CIPHER_HPP

#include <climits>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "common/types.hpp"
#include "crypto/crypto_error.hpp"

namespace shardpack::crypto {

enum class CipherAlgorithm {
  AesGcm,
  ChaCha20Poly1305
};

// "AES-GCM" / "ChaCha20-Poly1305"
const char* to_string(CipherAlgorithm algorithm);
// Returns std::nullopt for unrecognized names
std::optional<CipherAlgorithm> cipher_algorithm_from_string(const std::string& name);

// Output of a single encrypt call. The authentication tag is appended to the
// ciphertext. key_material is set only when the key was generated by the call
// and must be persisted by the caller.
struct EncryptionEnvelope {
  Bytes iv;
  std::string algorithm;
  Bytes ciphertext;
  std::string key_material;
};

class Cipher {
public:
  static constexpr size_t IV_SIZE = 12;      // 96-bit nonce for the AEAD modes
  static constexpr size_t TAG_SIZE = 16;     // 128-bit authentication tag
  static constexpr size_t SALT_SIZE = 16;
  static constexpr size_t DERIVED_KEY_SIZE = 32;
  static constexpr int DEFAULT_PBKDF2_ITERATIONS = 100000;
  // Largest slice handed to one EVP update call
  static constexpr size_t MAX_UPDATE_SIZE = static_cast<size_t>(INT_MAX);

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Inputs longer than update_size are processed in slices of that size.
  // Throws std::invalid_argument for 0 or anything above MAX_UPDATE_SIZE.
  explicit Cipher(size_t update_size = MAX_UPDATE_SIZE);
  ~Cipher();


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Encrypts the whole plaintext with a fresh random IV. When key_hex is empty
  // a key of key_bits is generated and returned in the envelope.
  EncryptionEnvelope encrypt(const Bytes& plaintext,
                             const std::optional<std::string>& key_hex,
                             CipherAlgorithm algorithm,
                             size_t key_bits = 256) const;
  // Throws DecryptionError on wrong key length, unknown algorithm or a
  // tampered ciphertext
  Bytes decrypt(const EncryptionEnvelope& envelope, const std::string& key_hex) const;


  // ---- KEY MATERIAL ----
  static std::string generate_key(CipherAlgorithm algorithm, size_t key_bits);
  static bool validate_key(const std::string& key_hex, CipherAlgorithm algorithm, size_t key_bits);
  static bool is_supported_key_size(CipherAlgorithm algorithm, size_t key_bits);
  // PBKDF2-HMAC-SHA256, 256-bit output, returned as hex
  static std::string derive_key_from_password(const std::string& password, const Bytes& salt,
                                              int iterations = DEFAULT_PBKDF2_ITERATIONS);
  static Bytes generate_salt();
  static Bytes generate_iv();

private:
  // ---- PARAMETERS ----
  size_t update_size_;


  // ---- UTILITY METHODS ----
  static Bytes random_bytes(size_t count);
  static Bytes decode_key(const std::string& key_hex);
};

} // namespace shardpack::crypto

#endif // SHARDPACK_CRYPTO_CIPHER_HPP
