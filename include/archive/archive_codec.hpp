#ifndef SHARDPACK_ARCHIVE_CODEC_HPP
#define SHARDPACK_ARCHIVE_CODEC_HPP

#include <cstdint>
#include <istream>
#include <limits>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "crypto/checksum.hpp"
#include "archive/archive_error.hpp"

namespace shardpack::archive {

// First record of every archive
struct ArchiveMetadata {
  static constexpr const char* FORMAT_VERSION = "1.0.0";

  std::string version = FORMAT_VERSION;
  uint64_t created_at = 0;
  uint32_t item_count = 0;
  uint64_t total_size = 0;                // sum of payload sizes
  std::vector<ContentId> root_ids;
  Digest checksum;                        // SHA-256 of the concatenated root ids
};

void to_json(nlohmann::json& j, const ArchiveMetadata& metadata);
void from_json(const nlohmann::json& j, ArchiveMetadata& metadata);

// Decoded archive. payloads[i] holds the bytes of metadata.root_ids[i].
struct Archive {
  ArchiveMetadata metadata;
  std::vector<Bytes> payloads;
};

// Frames an archive as [u32 big-endian length][payload] records, metadata
// JSON first, optionally wrapped in gzip. Payloads are opaque to the codec.
class ArchiveCodec {
public:
  static constexpr size_t LENGTH_PREFIX_SIZE = sizeof(uint32_t);

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Compressed archives may not inflate past max_decoded_size bytes
  explicit ArchiveCodec(const crypto::Checksum& checksum,
                        uint64_t max_decoded_size = std::numeric_limits<uint64_t>::max());


  // ---- ENCODING/DECODING ----
  // Throws ArchiveError when the metadata disagrees with the payloads or a
  // record does not fit the length prefix
  Bytes encode(const Archive& archive, bool compress) const;
  // Throws ArchiveParseError on any framing or metadata problem
  Archive decode(const Bytes& data) const;
  // Lists every problem found in data without throwing. Empty when valid.
  std::vector<std::string> validate(const Bytes& data) const;


  // ---- METADATA ----
  ArchiveMetadata make_metadata(const std::vector<ContentId>& root_ids, const std::vector<Bytes>& payloads) const;
  Digest root_ids_checksum(const std::vector<ContentId>& root_ids) const;


  // ---- GETTERS ----
  size_t max_decoded_size() const { return max_decoded_size_; }

private:
  // ---- PARAMETERS ----
  const crypto::Checksum& checksum_;
  size_t max_decoded_size_;


  // ---- FRAMING ----
  // Reads every record of an uncompressed stream
  std::vector<Bytes> read_records(const Bytes& data) const;
  ArchiveMetadata parse_metadata(const Bytes& record) const;
  void write_record(std::ostream& output, const uint8_t* data, size_t size) const;
  void write_bytes(std::ostream& output, const void* data, std::size_t size) const;
  void read_bytes(std::istream& input, void* data, std::size_t size) const;
};

} // namespace shardpack::archive

#endif // SHARDPACK_ARCHIVE_CODEC_HPP
