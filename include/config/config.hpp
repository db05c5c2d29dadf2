#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include "crypto/cipher.hpp"

namespace shardpack {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Config error: " + message) {}
};

struct ShardingConfig {
  bool enabled = true;
  uint64_t piece_size = 1024 * 1024;
  uint32_t max_pieces = 10;
  uint32_t replication_factor = 1;
};

struct EncryptionConfig {
  bool enabled = false;
  crypto::CipherAlgorithm algorithm = crypto::CipherAlgorithm::AesGcm;
  size_t key_bits = 256;
  std::string key_hex;                  // empty: generate a key per upload
};

struct ArchiveConfig {
  bool compress = false;
  uint64_t max_size = 100 * 1024 * 1024;
  bool resolve_manifests = true;
};

struct ConcurrencyConfig {
  size_t max_parallel_operations = 4;
};

struct LoggingConfig {
  std::string file = "shardpack.log";
  std::string level = "info";
};

struct PipelineConfig {
  ShardingConfig sharding;
  EncryptionConfig encryption;
  ArchiveConfig archive;
  ConcurrencyConfig concurrency;
  LoggingConfig logging;

  // Throws ConfigError on the first invalid setting
  void validate() const;
};

// Reads a JSON configuration file. Missing keys keep their defaults; the
// result is validated before it is returned.
PipelineConfig load_config(const std::string& path);

// Same as load_config for an in-memory JSON document
PipelineConfig parse_config(const std::string& json_text);

} // namespace config
} // namespace shardpack
