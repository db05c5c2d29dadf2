#include "config/config.hpp"
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>
#include <nlohmann/json.hpp>
#include <boost/log/trivial.hpp>
#include "logger/logger.hpp"

namespace shardpack {
namespace config {

namespace {

template <typename T>
void read_optional(const nlohmann::json& section, const char* key, T& target) {
  if (!section.contains(key)) {
    return;
  }

  const auto& value = section.at(key);
  if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
    // get_to would wrap negative or oversized numbers into the unsigned field
    if (!value.is_number_unsigned() || value.get<uint64_t>() > std::numeric_limits<T>::max()) {
      throw ConfigError(std::string("'") + key + "' must be an integer between 0 and " +
                        std::to_string(std::numeric_limits<T>::max()));
    }
  }
  value.get_to(target);
}

const nlohmann::json& section_or_empty(const nlohmann::json& root, const char* key) {
  static const nlohmann::json empty = nlohmann::json::object();
  if (!root.contains(key)) {
    return empty;
  }
  const auto& section = root.at(key);
  if (!section.is_object()) {
    throw ConfigError(std::string("Section '") + key + "' must be an object");
  }
  return section;
}

} // namespace

//==============================================
// VALIDATION
//==============================================

void PipelineConfig::validate() const {
  if (sharding.piece_size == 0) {
    throw ConfigError("sharding.pieceSize must be positive");
  }
  if (sharding.max_pieces == 0) {
    throw ConfigError("sharding.maxPieces must be positive");
  }
  if (sharding.replication_factor == 0) {
    throw ConfigError("sharding.replicationFactor must be positive");
  }

  if (!crypto::Cipher::is_supported_key_size(encryption.algorithm, encryption.key_bits)) {
    throw ConfigError("encryption.keyBits " + std::to_string(encryption.key_bits) + " is not valid for " +
                      crypto::to_string(encryption.algorithm));
  }
  if (!encryption.key_hex.empty() &&
      !crypto::Cipher::validate_key(encryption.key_hex, encryption.algorithm, encryption.key_bits)) {
    throw ConfigError("encryption.keyHex is not a " + std::to_string(encryption.key_bits) + "-bit hex key");
  }

  if (archive.max_size == 0) {
    throw ConfigError("archive.maxSize must be positive");
  }
  if (concurrency.max_parallel_operations == 0) {
    throw ConfigError("concurrency.maxParallelOperations must be positive");
  }

  try {
    shardpack::logging::parse_severity(logging.level);
  } catch (const std::invalid_argument&) {
    throw ConfigError("logging.level '" + logging.level + "' is not a severity level");
  }
}

//==============================================
// LOADING
//==============================================

PipelineConfig parse_config(const std::string& json_text) {
  PipelineConfig config;

  try {
    const auto root = nlohmann::json::parse(json_text);
    if (!root.is_object()) {
      throw ConfigError("Configuration must be a JSON object");
    }

    const auto& sharding = section_or_empty(root, "sharding");
    read_optional(sharding, "enabled", config.sharding.enabled);
    read_optional(sharding, "pieceSize", config.sharding.piece_size);
    read_optional(sharding, "maxPieces", config.sharding.max_pieces);
    read_optional(sharding, "replicationFactor", config.sharding.replication_factor);

    const auto& encryption = section_or_empty(root, "encryption");
    read_optional(encryption, "enabled", config.encryption.enabled);
    if (encryption.contains("algorithm")) {
      const auto name = encryption.at("algorithm").get<std::string>();
      auto algorithm = crypto::cipher_algorithm_from_string(name);
      if (!algorithm) {
        throw ConfigError("Unknown encryption algorithm: " + name);
      }
      config.encryption.algorithm = *algorithm;
    }
    read_optional(encryption, "keyBits", config.encryption.key_bits);
    read_optional(encryption, "keyHex", config.encryption.key_hex);

    const auto& archive = section_or_empty(root, "archive");
    read_optional(archive, "compress", config.archive.compress);
    read_optional(archive, "maxSize", config.archive.max_size);
    read_optional(archive, "resolveManifests", config.archive.resolve_manifests);

    const auto& concurrency = section_or_empty(root, "concurrency");
    read_optional(concurrency, "maxParallelOperations", config.concurrency.max_parallel_operations);

    const auto& logging_section = section_or_empty(root, "logging");
    read_optional(logging_section, "file", config.logging.file);
    read_optional(logging_section, "level", config.logging.level);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(e.what());
  }

  config.validate();
  return config;
}

PipelineConfig load_config(const std::string& path) {
  BOOST_LOG_TRIVIAL(info) << "Config: Loading configuration from " << path;

  std::ifstream file(path);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Config: Failed to open " << path;
    throw ConfigError("Failed to open " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_config(buffer.str());
}

} // namespace config
} // namespace shardpack
