#include <gtest/gtest.h>
#include <string>
#include "crypto/checksum.hpp"
#include "test_utils.hpp"

using namespace shardpack;
using namespace shardpack::crypto;

class ChecksumTest : public ::testing::Test {
protected:
  Checksum checksum;

  void SetUp() override {
    test::init_logging();
  }
};

TEST_F(ChecksumTest, KnownVectors) {
  EXPECT_EQ(checksum.digest(std::string("")),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(checksum.digest(std::string("abc")),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, OverloadsAgree) {
  const std::string text = "The quick brown fox";
  Bytes bytes = test::make_bytes(text);

  EXPECT_EQ(checksum.digest(bytes), checksum.digest(text));
  EXPECT_EQ(checksum.digest(bytes.data(), bytes.size()), checksum.digest(text));
  EXPECT_EQ(checksum.digest(Bytes{}), checksum.digest(std::string()));
}

TEST_F(ChecksumTest, SingleByteChangeChangesDigest) {
  Bytes data = test::random_bytes(4096);
  Digest original = checksum.digest(data);

  data[2048] ^= 0x01;
  EXPECT_NE(checksum.digest(data), original);
  EXPECT_EQ(original.size(), Checksum::DIGEST_SIZE * 2);
}

TEST_F(ChecksumTest, ConstantTimeEquality) {
  Digest a = checksum.digest(std::string("a"));
  Digest b = checksum.digest(std::string("b"));

  EXPECT_TRUE(Checksum::equal(a, a));
  EXPECT_FALSE(Checksum::equal(a, b));
  EXPECT_FALSE(Checksum::equal(a, a.substr(0, 10)));
}

TEST_F(ChecksumTest, HexRoundTrip) {
  Bytes data = {0x00, 0x01, 0x7f, 0x80, 0xfe, 0xff};
  EXPECT_EQ(to_hex(data), "00017f80feff");
  EXPECT_EQ(from_hex("00017f80feff"), data);
  EXPECT_EQ(from_hex("00017F80FEFF"), data);
  EXPECT_TRUE(from_hex("").empty());
}

TEST_F(ChecksumTest, InvalidHexRejected) {
  EXPECT_THROW(from_hex("abc"), std::invalid_argument);
  EXPECT_THROW(from_hex("zz"), std::invalid_argument);
}
