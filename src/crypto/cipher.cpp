#include "crypto/cipher.hpp"
#include "crypto/checksum.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace shardpack::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("Cipher: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  EVP_CIPHER_CTX* get() { return ctx; }
};

namespace {

// Resolves the OpenSSL cipher for an algorithm and raw key length
const EVP_CIPHER* select_cipher(CipherAlgorithm algorithm, size_t key_size) {
  switch (algorithm) {
    case CipherAlgorithm::AesGcm:
      switch (key_size) {
        case 16: return EVP_aes_128_gcm();
        case 24: return EVP_aes_192_gcm();
        case 32: return EVP_aes_256_gcm();
        default: return nullptr;
      }
    case CipherAlgorithm::ChaCha20Poly1305:
      return key_size == 32 ? EVP_chacha20_poly1305() : nullptr;
  }
  return nullptr;
}

} // namespace

const char* to_string(CipherAlgorithm algorithm) {
  switch (algorithm) {
    case CipherAlgorithm::AesGcm:           return "AES-GCM";
    case CipherAlgorithm::ChaCha20Poly1305: return "ChaCha20-Poly1305";
  }
  return "unknown";
}

std::optional<CipherAlgorithm> cipher_algorithm_from_string(const std::string& name) {
  if (name == "AES-GCM") {
    return CipherAlgorithm::AesGcm;
  }
  if (name == "ChaCha20-Poly1305") {
    return CipherAlgorithm::ChaCha20Poly1305;
  }
  return std::nullopt;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Cipher::Cipher(size_t update_size) : update_size_(update_size) {
  BOOST_LOG_TRIVIAL(debug) << "Cipher: Initializing Cipher";
  if (update_size_ == 0 || update_size_ > MAX_UPDATE_SIZE) {
    throw std::invalid_argument("Cipher: Update size must be between 1 and " + std::to_string(MAX_UPDATE_SIZE));
  }
}

Cipher::~Cipher() = default;

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

EncryptionEnvelope Cipher::encrypt(const Bytes& plaintext,
                                   const std::optional<std::string>& key_hex,
                                   CipherAlgorithm algorithm,
                                   size_t key_bits) const {
  BOOST_LOG_TRIVIAL(info) << "Cipher: Encrypting " << plaintext.size() << " bytes with " << to_string(algorithm);

  EncryptionEnvelope envelope;
  envelope.algorithm = to_string(algorithm);

  std::string key_string;
  if (key_hex && !key_hex->empty()) {
    key_string = *key_hex;
  } else {
    key_string = generate_key(algorithm, key_bits);
    envelope.key_material = key_string;
    BOOST_LOG_TRIVIAL(debug) << "Cipher: Generated " << key_bits << "-bit key";
  }

  Bytes key;
  try {
    key = from_hex(key_string);
  } catch (const std::invalid_argument&) {
    throw InitializationError("Cipher: Key is not valid hex");
  }

  const EVP_CIPHER* cipher = select_cipher(algorithm, key.size());
  if (!cipher) {
    BOOST_LOG_TRIVIAL(error) << "Cipher: Invalid key size: " << key.size() << " bytes for " << to_string(algorithm);
    throw InitializationError("Cipher: Invalid key size");
  }

  // A fresh IV for every call, never reused with the same key
  envelope.iv = generate_iv();

  CipherContext context;
  if (!EVP_EncryptInit_ex(context.get(), cipher, nullptr, nullptr, nullptr) ||
      !EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(IV_SIZE), nullptr) ||
      !EVP_EncryptInit_ex(context.get(), nullptr, nullptr, key.data(), envelope.iv.data())) {
    throw EncryptionError("Cipher: Failed to initialize encryption context");
  }

  envelope.ciphertext.resize(plaintext.size() + TAG_SIZE);
  int outlen = 0;
  size_t written = 0;

  for (size_t offset = 0; offset < plaintext.size();) {
    const size_t length = std::min(plaintext.size() - offset, update_size_);
    if (!EVP_EncryptUpdate(context.get(), envelope.ciphertext.data() + written, &outlen,
                           plaintext.data() + offset, static_cast<int>(length))) {
      throw EncryptionError("Cipher: Failed to encrypt data");
    }
    written += static_cast<size_t>(outlen);
    offset += length;
  }

  if (!EVP_EncryptFinal_ex(context.get(), envelope.ciphertext.data() + written, &outlen)) {
    throw EncryptionError("Cipher: Failed to finalize encryption");
  }
  written += static_cast<size_t>(outlen);

  if (!EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(TAG_SIZE),
                           envelope.ciphertext.data() + written)) {
    throw EncryptionError("Cipher: Failed to read authentication tag");
  }
  envelope.ciphertext.resize(written + TAG_SIZE);

  BOOST_LOG_TRIVIAL(debug) << "Cipher: Produced " << envelope.ciphertext.size() << " bytes of ciphertext";
  return envelope;
}

Bytes Cipher::decrypt(const EncryptionEnvelope& envelope, const std::string& key_hex) const {
  BOOST_LOG_TRIVIAL(info) << "Cipher: Decrypting " << envelope.ciphertext.size() << " bytes with " << envelope.algorithm;

  auto algorithm = cipher_algorithm_from_string(envelope.algorithm);
  if (!algorithm) {
    BOOST_LOG_TRIVIAL(error) << "Cipher: Unrecognized algorithm: " << envelope.algorithm;
    throw DecryptionError("Unrecognized algorithm: " + envelope.algorithm);
  }

  Bytes key = decode_key(key_hex);
  const EVP_CIPHER* cipher = select_cipher(*algorithm, key.size());
  if (!cipher) {
    BOOST_LOG_TRIVIAL(error) << "Cipher: Invalid key size: " << key.size() << " bytes for " << envelope.algorithm;
    throw DecryptionError("Invalid key size");
  }

  if (envelope.iv.size() != IV_SIZE) {
    throw DecryptionError("Invalid IV size");
  }

  if (envelope.ciphertext.size() < TAG_SIZE) {
    throw DecryptionError("Ciphertext shorter than authentication tag");
  }

  const size_t data_size = envelope.ciphertext.size() - TAG_SIZE;
  Bytes tag(envelope.ciphertext.begin() + static_cast<std::ptrdiff_t>(data_size), envelope.ciphertext.end());

  CipherContext context;
  if (!EVP_DecryptInit_ex(context.get(), cipher, nullptr, nullptr, nullptr) ||
      !EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(IV_SIZE), nullptr) ||
      !EVP_DecryptInit_ex(context.get(), nullptr, nullptr, key.data(), envelope.iv.data())) {
    throw DecryptionError("Failed to initialize decryption context");
  }

  Bytes plaintext(data_size + EVP_MAX_BLOCK_LENGTH);
  int outlen = 0;
  size_t written = 0;

  for (size_t offset = 0; offset < data_size;) {
    const size_t length = std::min(data_size - offset, update_size_);
    if (!EVP_DecryptUpdate(context.get(), plaintext.data() + written, &outlen,
                           envelope.ciphertext.data() + offset, static_cast<int>(length))) {
      throw DecryptionError("Failed to decrypt data");
    }
    written += static_cast<size_t>(outlen);
    offset += length;
  }

  if (!EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(TAG_SIZE), tag.data())) {
    throw DecryptionError("Failed to set authentication tag");
  }

  if (EVP_DecryptFinal_ex(context.get(), plaintext.data() + written, &outlen) <= 0) {
    ERR_clear_error();
    BOOST_LOG_TRIVIAL(error) << "Cipher: Authentication failed";
    throw DecryptionError("Authentication failed");
  }
  written += static_cast<size_t>(outlen);
  plaintext.resize(written);

  BOOST_LOG_TRIVIAL(debug) << "Cipher: Recovered " << plaintext.size() << " bytes of plaintext";
  return plaintext;
}

//==============================================
// KEY MATERIAL
//==============================================

bool Cipher::is_supported_key_size(CipherAlgorithm algorithm, size_t key_bits) {
  return key_bits % 8 == 0 && select_cipher(algorithm, key_bits / 8) != nullptr;
}

std::string Cipher::generate_key(CipherAlgorithm algorithm, size_t key_bits) {
  if (!is_supported_key_size(algorithm, key_bits)) {
    throw InitializationError("Cipher: Unsupported key size " + std::to_string(key_bits) +
                              " for " + to_string(algorithm));
  }
  return to_hex(random_bytes(key_bits / 8));
}

bool Cipher::validate_key(const std::string& key_hex, CipherAlgorithm algorithm, size_t key_bits) {
  if (!is_supported_key_size(algorithm, key_bits)) {
    return false;
  }
  try {
    return from_hex(key_hex).size() == key_bits / 8;
  } catch (const std::invalid_argument&) {
    return false;
  }
}

std::string Cipher::derive_key_from_password(const std::string& password, const Bytes& salt, int iterations) {
  if (iterations <= 0) {
    throw std::invalid_argument("Cipher: PBKDF2 iteration count must be positive");
  }

  Bytes derived(DERIVED_KEY_SIZE);
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                        salt.data(), static_cast<int>(salt.size()),
                        iterations, EVP_sha256(),
                        static_cast<int>(derived.size()), derived.data()) != 1) {
    throw InitializationError("Cipher: Key derivation failed");
  }
  return to_hex(derived);
}

Bytes Cipher::generate_salt() {
  return random_bytes(SALT_SIZE);
}

Bytes Cipher::generate_iv() {
  BOOST_LOG_TRIVIAL(trace) << "Cipher: Generating initialization vector";
  return random_bytes(IV_SIZE);
}

//==============================================
// UTILITY METHODS
//==============================================

Bytes Cipher::random_bytes(size_t count) {
  Bytes buffer(count);
  if (count > 0 && RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw InitializationError("Cipher: Failed to generate random bytes");
  }
  return buffer;
}

Bytes Cipher::decode_key(const std::string& key_hex) {
  try {
    return from_hex(key_hex);
  } catch (const std::invalid_argument&) {
    throw DecryptionError("Key is not valid hex");
  }
}

} // namespace shardpack::crypto
