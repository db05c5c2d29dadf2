#include <gtest/gtest.h>
#include <algorithm>
#include <boost/endian/conversion.hpp>
#include <cstring>
#include <nlohmann/json.hpp>
#include "archive/archive_codec.hpp"
#include "archive/compression.hpp"
#include "crypto/checksum.hpp"
#include "test_utils.hpp"

using namespace shardpack;
using namespace shardpack::archive;

class ArchiveCodecTest : public ::testing::Test {
protected:
  crypto::Checksum checksum;
  std::unique_ptr<ArchiveCodec> codec;
  std::vector<ContentId> ids;
  std::vector<Bytes> payloads;

  void SetUp() override {
    test::init_logging();
    codec = std::make_unique<ArchiveCodec>(checksum);
    payloads = {test::make_bytes("first item"), test::random_bytes(5000), Bytes{}};
    for (const auto& payload : payloads) {
      ids.push_back(checksum.digest(payload));
    }
  }

  Archive make_archive() {
    return Archive{codec->make_metadata(ids, payloads), payloads};
  }

  // Hand-built uncompressed stream: metadata JSON followed by raw records
  static Bytes frame(const std::vector<Bytes>& records) {
    Bytes out;
    for (const auto& record : records) {
      uint32_t length = boost::endian::native_to_big(static_cast<uint32_t>(record.size()));
      const auto* prefix = reinterpret_cast<const uint8_t*>(&length);
      out.insert(out.end(), prefix, prefix + sizeof(length));
      out.insert(out.end(), record.begin(), record.end());
    }
    return out;
  }
};

TEST_F(ArchiveCodecTest, EncodeDecode) {
  Archive archive = make_archive();
  Archive decoded = codec->decode(codec->encode(archive, false));

  EXPECT_EQ(decoded.metadata.version, "1.0.0");
  EXPECT_EQ(decoded.metadata.item_count, 3u);
  EXPECT_EQ(decoded.metadata.total_size, 10u + 5000u);
  EXPECT_EQ(decoded.metadata.root_ids, ids);
  EXPECT_EQ(decoded.payloads, payloads);
}

TEST_F(ArchiveCodecTest, WireFormat) {
  Archive archive = make_archive();
  Bytes encoded = codec->encode(archive, false);

  uint32_t network_length;
  std::memcpy(&network_length, encoded.data(), sizeof(network_length));
  uint32_t length = boost::endian::big_to_native(network_length);

  auto metadata = nlohmann::json::parse(encoded.begin() + 4, encoded.begin() + 4 + length);
  EXPECT_EQ(metadata["itemCount"], 3);
  EXPECT_EQ(metadata["rootIds"].size(), 3u);
  EXPECT_EQ(metadata["checksum"], codec->root_ids_checksum(ids));
  EXPECT_TRUE(metadata.contains("createdAt"));
  EXPECT_TRUE(metadata.contains("totalSize"));

  // Record after the metadata holds the first payload
  std::memcpy(&network_length, encoded.data() + 4 + length, sizeof(network_length));
  EXPECT_EQ(boost::endian::big_to_native(network_length), payloads[0].size());
}

TEST_F(ArchiveCodecTest, ReencodingIsByteIdentical) {
  Bytes encoded = codec->encode(make_archive(), false);
  Archive decoded = codec->decode(encoded);
  EXPECT_EQ(codec->encode(decoded, false), encoded);
}

TEST_F(ArchiveCodecTest, CompressedArchive) {
  Archive archive = make_archive();
  Bytes compressed = codec->encode(archive, true);

  ASSERT_TRUE(is_gzip(compressed));
  Archive decoded = codec->decode(compressed);
  EXPECT_EQ(decoded.payloads, payloads);
  EXPECT_EQ(gzip_decompress(compressed), codec->encode(decoded, false));
}

TEST_F(ArchiveCodecTest, GzipRoundTrip) {
  Bytes data = test::random_bytes(200000);
  Bytes text(100000, 'a');

  EXPECT_EQ(gzip_decompress(gzip_compress(data)), data);
  EXPECT_EQ(gzip_decompress(gzip_compress(Bytes{})), Bytes{});
  EXPECT_LT(gzip_compress(text).size(), text.size() / 10);
  EXPECT_FALSE(is_gzip(test::make_bytes("{}")));
}

TEST_F(ArchiveCodecTest, CorruptGzipRejected) {
  Bytes compressed = codec->encode(make_archive(), true);
  compressed.resize(compressed.size() / 2);
  EXPECT_THROW(codec->decode(compressed), ArchiveParseError);

  Bytes garbage = {0x1f, 0x8b, 0x00, 0x01, 0x02, 0x03};
  EXPECT_THROW(codec->decode(garbage), ArchiveParseError);
}

TEST_F(ArchiveCodecTest, DecompressionLimit) {
  Bytes zeros(4 * 1024 * 1024, 0);
  Bytes bomb = gzip_compress(zeros);
  ASSERT_LT(bomb.size(), 64u * 1024);

  EXPECT_THROW(gzip_decompress(bomb, 1024 * 1024), ArchiveParseError);
  EXPECT_EQ(gzip_decompress(bomb, zeros.size()), zeros);
}

TEST_F(ArchiveCodecTest, DecodeRespectsDecodedSizeLimit) {
  Archive archive = make_archive();
  Bytes compressed = codec->encode(archive, true);
  const size_t framed_size = codec->encode(archive, false).size();

  ArchiveCodec limited(checksum, framed_size - 1);
  EXPECT_THROW(limited.decode(compressed), ArchiveParseError);
  auto problems = limited.validate(compressed);
  ASSERT_EQ(problems.size(), 1u);
  EXPECT_EQ(problems[0].rfind("Decompression failed: ", 0), 0u);

  ArchiveCodec exact(checksum, framed_size);
  EXPECT_EQ(exact.decode(compressed).payloads, payloads);
}

TEST_F(ArchiveCodecTest, TruncatedRecordRejected) {
  Bytes encoded = codec->encode(make_archive(), false);

  Bytes truncated(encoded.begin(), encoded.end() - 100);
  EXPECT_THROW(codec->decode(truncated), ArchiveParseError);

  // Length prefix cut in half
  Bytes cut = frame({test::make_bytes("{}")});
  cut.push_back(0x00);
  cut.push_back(0x00);
  EXPECT_THROW(codec->decode(cut), ArchiveParseError);
}

TEST_F(ArchiveCodecTest, InvalidMetadataRejected) {
  EXPECT_THROW(codec->decode(Bytes{}), ArchiveParseError);
  EXPECT_THROW(codec->decode(frame({test::make_bytes("not json")})), ArchiveParseError);
  EXPECT_THROW(codec->decode(frame({test::make_bytes("{\"version\":\"1.0.0\"}")})), ArchiveParseError);
}

TEST_F(ArchiveCodecTest, CountMismatchRejected) {
  ArchiveMetadata metadata = codec->make_metadata(ids, payloads);
  std::string json = nlohmann::json(metadata).dump();

  // Metadata lists three items, only two payload records follow
  EXPECT_THROW(codec->decode(frame({Bytes(json.begin(), json.end()), payloads[0], payloads[1]})),
               ArchiveParseError);

  metadata.item_count = 2;
  json = nlohmann::json(metadata).dump();
  EXPECT_THROW(codec->decode(frame({Bytes(json.begin(), json.end()), payloads[0], payloads[1], payloads[2]})),
               ArchiveParseError);
}

TEST_F(ArchiveCodecTest, ChecksumMismatchRejected) {
  ArchiveMetadata metadata = codec->make_metadata(ids, payloads);
  metadata.checksum = checksum.digest(std::string("tampered"));
  std::string json = nlohmann::json(metadata).dump();

  EXPECT_THROW(codec->decode(frame({Bytes(json.begin(), json.end()), payloads[0], payloads[1], payloads[2]})),
               ArchiveParseError);
}

TEST_F(ArchiveCodecTest, EncodeRejectsInconsistentArchive) {
  Archive archive = make_archive();
  archive.payloads.pop_back();
  EXPECT_THROW(codec->encode(archive, false), ArchiveError);
  EXPECT_THROW(codec->make_metadata(ids, {payloads[0]}), ArchiveError);
}

TEST_F(ArchiveCodecTest, ValidateReportsProblems) {
  EXPECT_TRUE(codec->validate(codec->encode(make_archive(), false)).empty());
  EXPECT_TRUE(codec->validate(codec->encode(make_archive(), true)).empty());

  EXPECT_EQ(codec->validate(Bytes{}), std::vector<std::string>{"Empty archive"});

  auto problems = codec->validate(frame({test::make_bytes("{\"itemCount\":0}")}));
  EXPECT_GE(problems.size(), 2u);
  EXPECT_NE(std::find(problems.begin(), problems.end(), "Missing version"), problems.end());
  EXPECT_NE(std::find(problems.begin(), problems.end(), "Missing root ids"), problems.end());

  Bytes compressed = codec->encode(make_archive(), true);
  compressed.resize(20);
  problems = codec->validate(compressed);
  ASSERT_EQ(problems.size(), 1u);
  EXPECT_EQ(problems[0].rfind("Decompression failed", 0), 0u);
}

TEST_F(ArchiveCodecTest, RootIdsChecksumIsOrderSensitive) {
  std::vector<ContentId> reversed(ids.rbegin(), ids.rend());
  EXPECT_NE(codec->root_ids_checksum(ids), codec->root_ids_checksum(reversed));
  EXPECT_EQ(codec->root_ids_checksum(ids), codec->root_ids_checksum(ids));
}
