#include <gtest/gtest.h>
#include "crypto/checksum.hpp"
#include "sharding/chunker.hpp"
#include "sharding/manifest.hpp"
#include "sharding/reconstructor.hpp"
#include "sharding/replicator.hpp"
#include "test_utils.hpp"

using namespace shardpack;
using namespace shardpack::sharding;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class ReconstructorTest : public ::testing::Test {
protected:
  crypto::Checksum checksum;
  test::MemoryStore store;
  Bytes data;

  void SetUp() override {
    test::init_logging(logging::severity_level::error);
    data = test::random_bytes(1000);
  }

  // Splits data into 100-byte pieces, stores them and returns the manifest.
  // Replicas are the same bytes, so they share the primary's content id.
  Manifest store_object(const Bytes& object, uint32_t factor) {
    auto pieces = Replicator::replicate(Chunker::split(object, 100, 100), factor);
    Manifest manifest = build_manifest(checksum, object, 100, pieces, factor);
    for (size_t k = 0; k < pieces.size(); ++k) {
      manifest.pieces[k].content_id = store.put(*pieces[k].data);
    }
    return manifest;
  }
};

TEST_F(ReconstructorTest, ReassemblesIntactObject) {
  Manifest manifest = store_object(data, 1);
  Reconstructor reconstructor(store, checksum);
  EXPECT_EQ(reconstructor.reconstruct(manifest), data);
}

TEST_F(ReconstructorTest, ParallelFetches) {
  Manifest manifest = store_object(data, 2);
  Reconstructor reconstructor(store, checksum, 4);
  EXPECT_EQ(reconstructor.reconstruct(manifest), data);
}

TEST_F(ReconstructorTest, EmptyObjectNeedsNoFetch) {
  Manifest manifest = build_manifest(checksum, Bytes{}, 100, {}, 1);
  Reconstructor reconstructor(store, checksum);

  EXPECT_TRUE(reconstructor.reconstruct(manifest).empty());
  EXPECT_EQ(store.get_count(), 0u);
}

TEST_F(ReconstructorTest, FallsBackToReplicaOnCorruption) {
  Manifest manifest = store_object(data, 2);
  store.inject_fault(*manifest.pieces[3].content_id, test::Fault::Corrupt);

  Reconstructor reconstructor(store, checksum);
  EXPECT_EQ(reconstructor.reconstruct(manifest), data);
}

TEST_F(ReconstructorTest, FallsBackToReplicaWhenUnavailable) {
  Manifest manifest = store_object(data, 3);
  store.inject_fault(*manifest.pieces[7].content_id, test::Fault::Missing, 2);

  Reconstructor reconstructor(store, checksum);
  EXPECT_EQ(reconstructor.reconstruct(manifest), data);
}

TEST_F(ReconstructorTest, AllCopiesCorrupt) {
  Manifest manifest = store_object(data, 2);
  store.tamper(*manifest.pieces[5].content_id, 17);

  Reconstructor reconstructor(store, checksum);
  try {
    reconstructor.reconstruct(manifest);
    FAIL() << "Expected ShardRecoveryError";
  } catch (const ShardRecoveryError& e) {
    EXPECT_EQ(e.index(), 5u);
    EXPECT_EQ(e.failure(), ShardFailure::ChecksumMismatch);
    EXPECT_EQ(e.attempts(), 2u);
    EXPECT_EQ(e.expected_checksum(), manifest.pieces[5].checksum);
  }
}

TEST_F(ReconstructorTest, TamperWithoutReplicas) {
  Manifest manifest = store_object(data, 1);
  store.tamper(*manifest.pieces[2].content_id);

  Reconstructor reconstructor(store, checksum);
  try {
    reconstructor.reconstruct(manifest);
    FAIL() << "Expected ShardRecoveryError";
  } catch (const ShardRecoveryError& e) {
    EXPECT_EQ(e.index(), 2u);
    EXPECT_EQ(e.attempts(), 1u);
  }
}

TEST_F(ReconstructorTest, MissingPieceWithoutReplicasIsNotFound) {
  Manifest manifest = store_object(data, 1);
  store.erase(*manifest.pieces[4].content_id);

  Reconstructor reconstructor(store, checksum);
  EXPECT_THROW(reconstructor.reconstruct(manifest), store::NotFoundError);
}

TEST_F(ReconstructorTest, MissingPieceWithReplicasIsRecoveryError) {
  Manifest manifest = store_object(data, 2);
  store.erase(*manifest.pieces[1].content_id);

  Reconstructor reconstructor(store, checksum);
  try {
    reconstructor.reconstruct(manifest);
    FAIL() << "Expected ShardRecoveryError";
  } catch (const ShardRecoveryError& e) {
    EXPECT_EQ(e.index(), 1u);
    EXPECT_EQ(e.failure(), ShardFailure::Unavailable);
  }
}

TEST_F(ReconstructorTest, LowestFailingIndexReported) {
  Manifest manifest = store_object(data, 1);
  store.tamper(*manifest.pieces[8].content_id);
  store.tamper(*manifest.pieces[3].content_id);

  Reconstructor reconstructor(store, checksum, 4);
  try {
    reconstructor.reconstruct(manifest);
    FAIL() << "Expected ShardRecoveryError";
  } catch (const ShardRecoveryError& e) {
    EXPECT_EQ(e.index(), 3u);
  }
}

TEST_F(ReconstructorTest, WrongOriginalChecksum) {
  Manifest manifest = store_object(data, 1);
  manifest.original_checksum = checksum.digest(std::string("something else"));

  Reconstructor reconstructor(store, checksum);
  try {
    reconstructor.reconstruct(manifest);
    FAIL() << "Expected ManifestIntegrityError";
  } catch (const ManifestIntegrityError& e) {
    EXPECT_EQ(e.expected(), manifest.original_checksum);
    EXPECT_EQ(e.actual(), checksum.digest(data));
  }
}

TEST_F(ReconstructorTest, MalformedManifestRejectedBeforeFetch) {
  test::MockContentStore mock;
  EXPECT_CALL(mock, get(_)).Times(0);

  Manifest manifest = store_object(data, 2);
  manifest.pieces.pop_back();

  Reconstructor reconstructor(mock, checksum);
  EXPECT_THROW(reconstructor.reconstruct(manifest), MalformedManifestError);
  EXPECT_THROW(reconstructor.verify(manifest), MalformedManifestError);
}

TEST_F(ReconstructorTest, StoreErrorsPropagateThroughMock) {
  Bytes small = test::random_bytes(50);
  Manifest manifest = store_object(small, 1);

  test::MockContentStore mock;
  EXPECT_CALL(mock, get(*manifest.pieces[0].content_id))
    .WillOnce(Throw(store::StoreError("Store: disk failure")));

  Reconstructor reconstructor(mock, checksum);
  EXPECT_THROW(reconstructor.reconstruct(manifest), store::StoreError);
}

TEST_F(ReconstructorTest, VerifyReportsHealthyObject) {
  Manifest manifest = store_object(data, 2);
  Reconstructor reconstructor(store, checksum, 2);

  auto report = reconstructor.verify(manifest);
  EXPECT_TRUE(report.valid);
  EXPECT_TRUE(report.recoverable);
  EXPECT_TRUE(report.corrupted.empty());
  EXPECT_TRUE(report.missing.empty());
}

TEST_F(ReconstructorTest, VerifyReportsDamage) {
  Manifest manifest = store_object(data, 2);
  store.inject_fault(*manifest.pieces[0].content_id, test::Fault::Corrupt);
  store.inject_fault(*manifest.pieces[6].content_id, test::Fault::Missing);

  Reconstructor reconstructor(store, checksum);
  auto report = reconstructor.verify(manifest);

  EXPECT_FALSE(report.valid);
  EXPECT_TRUE(report.recoverable);
  EXPECT_EQ(report.corrupted, std::vector<uint32_t>{0});
  EXPECT_EQ(report.missing, std::vector<uint32_t>{6});
}

TEST_F(ReconstructorTest, VerifyReportsUnrecoverable) {
  Manifest manifest = store_object(data, 1);
  store.tamper(*manifest.pieces[9].content_id);

  Reconstructor reconstructor(store, checksum);
  auto report = reconstructor.verify(manifest);

  EXPECT_FALSE(report.valid);
  EXPECT_FALSE(report.recoverable);
  EXPECT_EQ(report.corrupted, std::vector<uint32_t>{9});
}

TEST_F(ReconstructorTest, RoundTripAcrossPieceSizes) {
  for (size_t size : {1u, 99u, 100u, 101u, 777u}) {
    Bytes object = test::random_bytes(size, static_cast<uint32_t>(size));
    for (uint64_t piece_size : {1u, 7u, 100u, 1000u}) {
      auto pieces = Replicator::replicate(Chunker::split(object, piece_size, 1000), 1);
      Manifest manifest = build_manifest(checksum, object, piece_size, pieces, 1);
      for (size_t k = 0; k < pieces.size(); ++k) {
        manifest.pieces[k].content_id = store.put(*pieces[k].data);
      }
      Reconstructor reconstructor(store, checksum, 3);
      EXPECT_EQ(reconstructor.reconstruct(manifest), object) << size << "/" << piece_size;
    }
  }
}
