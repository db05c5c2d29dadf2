#include "sharding/manifest.hpp"
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "crypto/cipher.hpp"

namespace shardpack::sharding {

namespace {

bool is_digest(const std::string& value) {
  return value.size() == crypto::Checksum::DIGEST_SIZE * 2 &&
    std::all_of(value.begin(), value.end(), [](char c) {
      return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

} // namespace

const char* to_string(ChunkingAlgorithm algorithm) {
  switch (algorithm) {
    case ChunkingAlgorithm::FixedSize: return "fixed-size";
  }
  return "unknown";
}

//==============================================
// JSON MAPPING
//==============================================

void to_json(nlohmann::json& j, const PieceInfo& piece) {
  j = nlohmann::json{
    {"index", piece.index},
    {"size", piece.size},
    {"checksum", piece.checksum}
  };
  if (piece.content_id) {
    j["contentId"] = *piece.content_id;
  }
}

void from_json(const nlohmann::json& j, PieceInfo& piece) {
  j.at("index").get_to(piece.index);
  j.at("size").get_to(piece.size);
  j.at("checksum").get_to(piece.checksum);
  if (j.contains("contentId") && !j.at("contentId").is_null()) {
    piece.content_id = j.at("contentId").get<std::string>();
  } else {
    piece.content_id.reset();
  }
}

void to_json(nlohmann::json& j, const Manifest& manifest) {
  j = nlohmann::json{
    {"formatVersion", manifest.format_version},
    {"originalSize", manifest.original_size},
    {"originalChecksum", manifest.original_checksum},
    {"pieceSize", manifest.piece_size},
    {"pieceCount", manifest.piece_count},
    {"replicationFactor", manifest.replication_factor},
    {"algorithm", to_string(manifest.algorithm)},
    {"pieces", manifest.pieces},
    {"createdAt", manifest.created_at}
  };
  if (manifest.encryption) {
    j["encryption"] = nlohmann::json{
      {"algorithm", manifest.encryption->algorithm},
      {"iv", manifest.encryption->iv}
    };
  }
}

void from_json(const nlohmann::json& j, Manifest& manifest) {
  j.at("formatVersion").get_to(manifest.format_version);
  j.at("originalSize").get_to(manifest.original_size);
  j.at("originalChecksum").get_to(manifest.original_checksum);
  j.at("pieceSize").get_to(manifest.piece_size);
  j.at("pieceCount").get_to(manifest.piece_count);
  j.at("replicationFactor").get_to(manifest.replication_factor);
  j.at("pieces").get_to(manifest.pieces);
  j.at("createdAt").get_to(manifest.created_at);

  const auto algorithm = j.at("algorithm").get<std::string>();
  if (algorithm != to_string(ChunkingAlgorithm::FixedSize)) {
    throw MalformedManifestError("Unrecognized algorithm: " + algorithm);
  }
  manifest.algorithm = ChunkingAlgorithm::FixedSize;

  if (j.contains("encryption") && !j.at("encryption").is_null()) {
    const auto& enc = j.at("encryption");
    manifest.encryption = ManifestEncryption{
      enc.at("algorithm").get<std::string>(),
      enc.at("iv").get<std::string>()
    };
  } else {
    manifest.encryption.reset();
  }
}

//==============================================
// CONSTRUCTION
//==============================================

Manifest build_manifest(const crypto::Checksum& checksum,
                        const Bytes& data,
                        uint64_t piece_size,
                        const std::vector<Piece>& pieces,
                        uint32_t replication_factor) {
  if (replication_factor == 0) {
    throw std::invalid_argument("Manifest: Replication factor must be positive");
  }
  if (pieces.size() % replication_factor != 0) {
    throw std::invalid_argument("Manifest: Piece set is not a whole number of replicas");
  }

  Manifest manifest;
  manifest.original_size = data.size();
  manifest.original_checksum = checksum.digest(data);
  manifest.piece_size = piece_size;
  manifest.piece_count = static_cast<uint32_t>(pieces.size() / replication_factor);
  manifest.replication_factor = replication_factor;
  manifest.created_at = current_time_millis();
  manifest.pieces.reserve(pieces.size());

  for (const auto& piece : pieces) {
    PieceInfo info;
    info.index = piece.index;
    info.size = piece.data->size();
    if (piece.index < manifest.piece_count) {
      info.checksum = checksum.digest(*piece.data);
      BOOST_LOG_TRIVIAL(trace) << "Manifest: Piece " << piece.index << " checksum " << info.checksum;
    } else {
      info.checksum = manifest.pieces[piece.index % manifest.piece_count].checksum;
    }
    manifest.pieces.push_back(std::move(info));
  }

  BOOST_LOG_TRIVIAL(debug) << "Manifest: Built manifest for " << manifest.original_size << " bytes, "
                           << manifest.piece_count << " pieces x " << replication_factor;
  return manifest;
}

//==============================================
// SERIALIZATION
//==============================================

Bytes serialize_manifest(const Manifest& manifest) {
  const std::string text = nlohmann::json(manifest).dump();
  return Bytes(text.begin(), text.end());
}

Manifest parse_manifest(const Bytes& data) {
  Manifest manifest;
  try {
    nlohmann::json::parse(data.begin(), data.end()).get_to(manifest);
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "Manifest: Failed to parse manifest JSON: " << e.what();
    throw MalformedManifestError(e.what());
  }
  validate_manifest(manifest, false);
  return manifest;
}

std::optional<Manifest> try_parse_manifest(const Bytes& data) {
  // Cheap rejection of anything that cannot be a JSON object
  auto first = std::find_if(data.begin(), data.end(), [](uint8_t c) {
    return c != ' ' && c != '\t' && c != '\r' && c != '\n';
  });
  if (first == data.end() || *first != '{') {
    return std::nullopt;
  }

  try {
    return parse_manifest(data);
  } catch (const MalformedManifestError&) {
    return std::nullopt;
  }
}

//==============================================
// VALIDATION
//==============================================

void validate_manifest(const Manifest& manifest, bool require_content_ids) {
  if (manifest.format_version != Manifest::FORMAT_VERSION) {
    throw MalformedManifestError("Unsupported format version: " + manifest.format_version);
  }
  if (manifest.replication_factor == 0) {
    throw MalformedManifestError("Replication factor is zero");
  }
  if (!is_digest(manifest.original_checksum)) {
    throw MalformedManifestError("Invalid original checksum");
  }

  const uint64_t expected_pieces = static_cast<uint64_t>(manifest.piece_count) * manifest.replication_factor;
  if (manifest.pieces.size() != expected_pieces) {
    throw MalformedManifestError("Expected " + std::to_string(expected_pieces) + " pieces, found " +
                                 std::to_string(manifest.pieces.size()));
  }

  if (manifest.piece_count == 0 && manifest.original_size != 0) {
    throw MalformedManifestError("Non-empty object without pieces");
  }
  if (manifest.piece_count > 0 && manifest.piece_size == 0) {
    throw MalformedManifestError("Piece size is zero");
  }

  uint64_t total = 0;
  for (size_t position = 0; position < manifest.pieces.size(); ++position) {
    const auto& piece = manifest.pieces[position];
    if (piece.index != position) {
      throw MalformedManifestError("Piece at position " + std::to_string(position) +
                                   " has index " + std::to_string(piece.index));
    }
    if (!is_digest(piece.checksum)) {
      throw MalformedManifestError("Invalid checksum for piece " + std::to_string(position));
    }
    if (require_content_ids && (!piece.content_id || piece.content_id->empty())) {
      throw MalformedManifestError("Piece " + std::to_string(position) + " has no content id");
    }

    if (position < manifest.piece_count) {
      if (piece.size > manifest.piece_size) {
        throw MalformedManifestError("Piece " + std::to_string(position) + " larger than piece size");
      }
      total += piece.size;
    } else {
      const auto& primary = manifest.pieces[position % manifest.piece_count];
      if (piece.checksum != primary.checksum || piece.size != primary.size) {
        throw MalformedManifestError("Replica " + std::to_string(position) + " differs from its primary");
      }
    }
  }

  if (total != manifest.original_size) {
    throw MalformedManifestError("Piece sizes sum to " + std::to_string(total) +
                                 ", expected " + std::to_string(manifest.original_size));
  }

  if (manifest.encryption) {
    if (!crypto::cipher_algorithm_from_string(manifest.encryption->algorithm)) {
      throw MalformedManifestError("Unrecognized encryption algorithm: " + manifest.encryption->algorithm);
    }
    try {
      if (crypto::from_hex(manifest.encryption->iv).size() != crypto::Cipher::IV_SIZE) {
        throw MalformedManifestError("Invalid encryption IV length");
      }
    } catch (const std::invalid_argument&) {
      throw MalformedManifestError("Encryption IV is not valid hex");
    }
  }
}

} // namespace shardpack::sharding
