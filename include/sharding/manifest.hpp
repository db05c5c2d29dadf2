#ifndef SHARDPACK_SHARDING_MANIFEST_HPP
#define SHARDPACK_SHARDING_MANIFEST_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "crypto/checksum.hpp"
#include "sharding/replicator.hpp"
#include "sharding/sharding_error.hpp"

namespace shardpack::sharding {

enum class ChunkingAlgorithm {
  FixedSize
};

// ---- PIECE AND MANIFEST TYPES ----
struct PieceInfo {
  uint32_t index = 0;
  uint64_t size = 0;
  Digest checksum;
  std::optional<ContentId> content_id;    // set once the piece is stored
};

// Parameters needed to decrypt the reassembled bytes. Never holds the key.
struct ManifestEncryption {
  std::string algorithm;
  std::string iv;                         // hex
};

struct Manifest {
  static constexpr const char* FORMAT_VERSION = "1.0.0";

  std::string format_version = FORMAT_VERSION;
  uint64_t original_size = 0;
  Digest original_checksum;
  uint64_t piece_size = 0;
  uint32_t piece_count = 0;
  uint32_t replication_factor = 1;
  ChunkingAlgorithm algorithm = ChunkingAlgorithm::FixedSize;
  std::vector<PieceInfo> pieces;
  uint64_t created_at = 0;
  std::optional<ManifestEncryption> encryption;

  bool is_encrypted() const { return encryption.has_value(); }
};

const char* to_string(ChunkingAlgorithm algorithm);


// ---- JSON MAPPING ----
void to_json(nlohmann::json& j, const PieceInfo& piece);
void from_json(const nlohmann::json& j, PieceInfo& piece);
void to_json(nlohmann::json& j, const Manifest& manifest);
void from_json(const nlohmann::json& j, Manifest& manifest);


// ---- CONSTRUCTION ----
// Builds a manifest for data split into the given replicated piece set.
// Checksums are computed once per primary and copied to its replicas;
// content ids are left empty.
Manifest build_manifest(const crypto::Checksum& checksum,
                        const Bytes& data,
                        uint64_t piece_size,
                        const std::vector<Piece>& pieces,
                        uint32_t replication_factor);


// ---- SERIALIZATION ----
// UTF-8 JSON with camelCase field names
Bytes serialize_manifest(const Manifest& manifest);
// Throws MalformedManifestError when the bytes are not a valid manifest
Manifest parse_manifest(const Bytes& data);
// std::nullopt instead of throwing
std::optional<Manifest> try_parse_manifest(const Bytes& data);


// ---- VALIDATION ----
// Checks the structural invariants. With require_content_ids every piece must
// carry the id it was stored under. Throws MalformedManifestError.
void validate_manifest(const Manifest& manifest, bool require_content_ids);

} // namespace shardpack::sharding

#endif // SHARDPACK_SHARDING_MANIFEST_HPP
