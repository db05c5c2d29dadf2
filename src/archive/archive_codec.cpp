#include "archive/archive_codec.hpp"
#include "archive/compression.hpp"
#include <algorithm>
#include <limits>
#include <sstream>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace shardpack::archive {

//==============================================
// METADATA JSON MAPPING
//==============================================

void to_json(nlohmann::json& j, const ArchiveMetadata& metadata) {
  j = nlohmann::json{
    {"version", metadata.version},
    {"createdAt", metadata.created_at},
    {"itemCount", metadata.item_count},
    {"totalSize", metadata.total_size},
    {"rootIds", metadata.root_ids},
    {"checksum", metadata.checksum}
  };
}

void from_json(const nlohmann::json& j, ArchiveMetadata& metadata) {
  j.at("version").get_to(metadata.version);
  j.at("createdAt").get_to(metadata.created_at);
  j.at("itemCount").get_to(metadata.item_count);
  j.at("totalSize").get_to(metadata.total_size);
  j.at("rootIds").get_to(metadata.root_ids);
  j.at("checksum").get_to(metadata.checksum);
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ArchiveCodec::ArchiveCodec(const crypto::Checksum& checksum, uint64_t max_decoded_size)
  : checksum_(checksum)
  , max_decoded_size_(static_cast<size_t>(
      std::min<uint64_t>(max_decoded_size, std::numeric_limits<size_t>::max()))) {}

//==============================================
// ENCODING/DECODING
//==============================================

Bytes ArchiveCodec::encode(const Archive& archive, bool compress) const {
  const auto& metadata = archive.metadata;
  BOOST_LOG_TRIVIAL(info) << "ArchiveCodec: Encoding archive with " << archive.payloads.size() << " items";

  if (metadata.item_count != metadata.root_ids.size() || metadata.root_ids.size() != archive.payloads.size()) {
    BOOST_LOG_TRIVIAL(error) << "ArchiveCodec: Metadata lists " << metadata.item_count << " items and "
                             << metadata.root_ids.size() << " root ids for " << archive.payloads.size() << " payloads";
    throw ArchiveError("ArchiveCodec: Metadata does not match payloads");
  }

  std::stringstream output;
  const std::string metadata_json = nlohmann::json(metadata).dump();
  BOOST_LOG_TRIVIAL(debug) << "ArchiveCodec: Writing metadata record of " << metadata_json.size() << " bytes";
  write_record(output, reinterpret_cast<const uint8_t*>(metadata_json.data()), metadata_json.size());

  for (size_t i = 0; i < archive.payloads.size(); ++i) {
    BOOST_LOG_TRIVIAL(trace) << "ArchiveCodec: Writing record for " << metadata.root_ids[i]
                             << " (" << archive.payloads[i].size() << " bytes)";
    write_record(output, archive.payloads[i].data(), archive.payloads[i].size());
  }

  const std::string framed = output.str();
  Bytes encoded(framed.begin(), framed.end());
  if (compress) {
    encoded = gzip_compress(encoded);
  }

  BOOST_LOG_TRIVIAL(info) << "ArchiveCodec: Encoded archive of " << encoded.size() << " bytes"
                          << (compress ? " (gzip)" : "");
  return encoded;
}

Archive ArchiveCodec::decode(const Bytes& data) const {
  BOOST_LOG_TRIVIAL(info) << "ArchiveCodec: Decoding archive of " << data.size() << " bytes";

  if (data.empty()) {
    throw ArchiveParseError("Empty archive");
  }

  std::vector<Bytes> records = is_gzip(data) ? read_records(gzip_decompress(data, max_decoded_size_)) : read_records(data);
  if (records.empty()) {
    throw ArchiveParseError("Archive contains no records");
  }

  Archive archive;
  archive.metadata = parse_metadata(records.front());

  const auto& metadata = archive.metadata;
  if (metadata.item_count != metadata.root_ids.size() || metadata.root_ids.size() != records.size() - 1) {
    BOOST_LOG_TRIVIAL(error) << "ArchiveCodec: itemCount " << metadata.item_count << ", "
                             << metadata.root_ids.size() << " root ids, " << records.size() - 1 << " payload records";
    throw ArchiveParseError("Item count does not match records");
  }

  const Digest expected = root_ids_checksum(metadata.root_ids);
  if (!crypto::Checksum::equal(expected, metadata.checksum)) {
    throw ArchiveParseError("Metadata checksum does not match root ids");
  }

  archive.payloads.reserve(records.size() - 1);
  for (size_t i = 1; i < records.size(); ++i) {
    archive.payloads.push_back(std::move(records[i]));
  }

  BOOST_LOG_TRIVIAL(info) << "ArchiveCodec: Decoded " << archive.payloads.size() << " items";
  return archive;
}

std::vector<std::string> ArchiveCodec::validate(const Bytes& data) const {
  std::vector<std::string> problems;

  if (data.empty()) {
    problems.push_back("Empty archive");
    return problems;
  }

  Bytes raw;
  if (is_gzip(data)) {
    try {
      raw = gzip_decompress(data, max_decoded_size_);
    } catch (const ArchiveError& e) {
      problems.push_back(std::string("Decompression failed: ") + e.what());
      return problems;
    }
  } else {
    raw = data;
  }

  std::vector<Bytes> records;
  try {
    records = read_records(raw);
  } catch (const ArchiveParseError& e) {
    problems.push_back(e.what());
    return problems;
  }
  if (records.empty()) {
    problems.push_back("Archive contains no records");
    return problems;
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(records.front().begin(), records.front().end());
  } catch (const nlohmann::json::exception& e) {
    problems.push_back(std::string("Metadata is not valid JSON: ") + e.what());
    return problems;
  }
  if (!json.is_object()) {
    problems.push_back("Metadata is not a JSON object");
    return problems;
  }

  if (!json.contains("version") || !json["version"].is_string()) {
    problems.push_back("Missing version");
  }

  std::vector<ContentId> root_ids;
  if (!json.contains("rootIds") || !json["rootIds"].is_array()) {
    problems.push_back("Missing root ids");
  } else {
    try {
      json["rootIds"].get_to(root_ids);
    } catch (const nlohmann::json::exception&) {
      problems.push_back("Root ids are not strings");
    }
    if (root_ids.empty()) {
      problems.push_back("No root ids");
    }
  }

  if (!json.contains("itemCount") || !json["itemCount"].is_number_unsigned()) {
    problems.push_back("Missing item count");
  } else if (json["itemCount"].get<uint64_t>() != root_ids.size()) {
    problems.push_back("Item count does not match root ids");
  }

  if (root_ids.size() != records.size() - 1) {
    problems.push_back("Expected " + std::to_string(root_ids.size()) + " payload records, found " +
                       std::to_string(records.size() - 1));
  }

  if (!json.contains("checksum") || !json["checksum"].is_string()) {
    problems.push_back("Missing checksum");
  } else if (json["checksum"].get<std::string>() != root_ids_checksum(root_ids)) {
    problems.push_back("Metadata checksum does not match root ids");
  }

  return problems;
}

//==============================================
// METADATA
//==============================================

ArchiveMetadata ArchiveCodec::make_metadata(const std::vector<ContentId>& root_ids,
                                            const std::vector<Bytes>& payloads) const {
  if (root_ids.size() != payloads.size()) {
    throw ArchiveError("ArchiveCodec: Root id count does not match payload count");
  }
  if (root_ids.size() > std::numeric_limits<uint32_t>::max()) {
    throw ArchiveError("ArchiveCodec: Too many items");
  }

  ArchiveMetadata metadata;
  metadata.created_at = current_time_millis();
  metadata.item_count = static_cast<uint32_t>(root_ids.size());
  metadata.root_ids = root_ids;
  metadata.checksum = root_ids_checksum(root_ids);
  for (const auto& payload : payloads) {
    metadata.total_size += payload.size();
  }
  return metadata;
}

Digest ArchiveCodec::root_ids_checksum(const std::vector<ContentId>& root_ids) const {
  std::string joined;
  for (const auto& id : root_ids) {
    joined += id;
  }
  return checksum_.digest(joined);
}

//==============================================
// FRAMING
//==============================================

std::vector<Bytes> ArchiveCodec::read_records(const Bytes& data) const {
  std::stringstream input(std::string(data.begin(), data.end()));
  std::vector<Bytes> records;

  while (input.peek() != std::char_traits<char>::eof()) {
    uint32_t network_length;
    read_bytes(input, &network_length, sizeof(network_length));
    const uint32_t length = boost::endian::big_to_native(network_length);

    // Reject a length running past the end before allocating for it
    const auto position = static_cast<size_t>(input.tellg());
    if (length > data.size() - position) {
      BOOST_LOG_TRIVIAL(error) << "ArchiveCodec: Record " << records.size() << " declares " << length
                               << " bytes, only " << data.size() - position << " remain";
      throw ArchiveParseError("Truncated record");
    }

    Bytes record(length);
    if (length > 0) {
      read_bytes(input, record.data(), record.size());
    }
    BOOST_LOG_TRIVIAL(trace) << "ArchiveCodec: Read record " << records.size() << " of " << length << " bytes";
    records.push_back(std::move(record));
  }

  return records;
}

ArchiveMetadata ArchiveCodec::parse_metadata(const Bytes& record) const {
  try {
    auto json = nlohmann::json::parse(record.begin(), record.end());
    return json.get<ArchiveMetadata>();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "ArchiveCodec: Invalid metadata record: " << e.what();
    throw ArchiveParseError(std::string("Invalid metadata record: ") + e.what());
  }
}

void ArchiveCodec::write_record(std::ostream& output, const uint8_t* data, size_t size) const {
  if (size > std::numeric_limits<uint32_t>::max()) {
    BOOST_LOG_TRIVIAL(error) << "ArchiveCodec: Record of " << size << " bytes exceeds length prefix";
    throw ArchiveError("ArchiveCodec: Record too large");
  }

  uint32_t network_length = boost::endian::native_to_big(static_cast<uint32_t>(size));
  write_bytes(output, &network_length, sizeof(network_length));
  if (size > 0) {
    write_bytes(output, data, size);
  }
}

void ArchiveCodec::write_bytes(std::ostream& output, const void* data, std::size_t size) const {
  if (!output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "ArchiveCodec: Failed to write " << size << " bytes to output stream";
    throw ArchiveError("ArchiveCodec: Failed to write to output stream");
  }
}

void ArchiveCodec::read_bytes(std::istream& input, void* data, std::size_t size) const {
  if (!input.read(static_cast<char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "ArchiveCodec: Failed to read " << size << " bytes from input stream";
    throw ArchiveParseError("Truncated record");
  }
}

} // namespace shardpack::archive
