#include "sharding/reconstructor.hpp"
#include <boost/log/trivial.hpp>
#include "utils/parallel.hpp"

namespace shardpack::sharding {

namespace {

enum class CopyState {
  Intact,
  Corrupted,
  Missing
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Reconstructor::Reconstructor(store::ContentStore& store, const crypto::Checksum& checksum, std::size_t max_parallel)
  : store_(store)
  , checksum_(checksum)
  , max_parallel_(max_parallel) {
  BOOST_LOG_TRIVIAL(debug) << "Reconstructor: Initialized with parallelism " << max_parallel_;
}

//==============================================
// RECONSTRUCTION
//==============================================

Bytes Reconstructor::reconstruct(const Manifest& manifest) const {
  validate_manifest(manifest, true);
  BOOST_LOG_TRIVIAL(info) << "Reconstructor: Reconstructing " << manifest.original_size << " bytes from "
                          << manifest.piece_count << " pieces";

  std::vector<Bytes> parts(manifest.piece_count);
  utils::run_indexed(manifest.piece_count, max_parallel_, [&](std::size_t i) {
    parts[i] = recover_piece(manifest, static_cast<uint32_t>(i));
  });

  Bytes data;
  data.reserve(static_cast<size_t>(manifest.original_size));
  for (auto& part : parts) {
    data.insert(data.end(), part.begin(), part.end());
    Bytes().swap(part);
  }

  const Digest actual = checksum_.digest(data);
  if (!crypto::Checksum::equal(actual, manifest.original_checksum)) {
    BOOST_LOG_TRIVIAL(error) << "Reconstructor: Object checksum mismatch, expected "
                             << manifest.original_checksum << ", got " << actual;
    throw ManifestIntegrityError(manifest.original_checksum, actual);
  }

  BOOST_LOG_TRIVIAL(info) << "Reconstructor: Reconstructed and verified " << data.size() << " bytes";
  return data;
}

Bytes Reconstructor::recover_piece(const Manifest& manifest, uint32_t index) const {
  const PieceInfo& primary = manifest.pieces[index];
  ShardFailure last_failure = ShardFailure::Unavailable;
  std::size_t attempts = 0;

  for (uint32_t round = 0; round < manifest.replication_factor; ++round) {
    const PieceInfo& copy = manifest.pieces[static_cast<size_t>(manifest.piece_count) * round + index];
    ++attempts;

    Bytes data;
    try {
      data = store_.get(*copy.content_id);
    } catch (const store::StoreError& e) {
      if (manifest.replication_factor == 1) {
        BOOST_LOG_TRIVIAL(error) << "Reconstructor: Piece " << index << " unavailable: " << e.what();
        throw;
      }
      BOOST_LOG_TRIVIAL(warning) << "Reconstructor: Copy " << copy.index << " of piece " << index
                                 << " unavailable: " << e.what();
      last_failure = ShardFailure::Unavailable;
      continue;
    }

    if (data.size() == primary.size && crypto::Checksum::equal(checksum_.digest(data), primary.checksum)) {
      if (round > 0) {
        BOOST_LOG_TRIVIAL(warning) << "Reconstructor: Piece " << index << " recovered from replica " << copy.index;
      } else {
        BOOST_LOG_TRIVIAL(trace) << "Reconstructor: Piece " << index << " verified";
      }
      return data;
    }

    BOOST_LOG_TRIVIAL(warning) << "Reconstructor: Checksum mismatch for copy " << copy.index << " of piece " << index;
    last_failure = ShardFailure::ChecksumMismatch;
  }

  BOOST_LOG_TRIVIAL(error) << "Reconstructor: No intact copy of piece " << index << " after " << attempts << " attempt(s)";
  throw ShardRecoveryError(index, last_failure, attempts, primary.checksum);
}

//==============================================
// VERIFICATION
//==============================================

VerificationReport Reconstructor::verify(const Manifest& manifest) const {
  validate_manifest(manifest, true);
  BOOST_LOG_TRIVIAL(info) << "Reconstructor: Verifying " << manifest.pieces.size() << " stored pieces";

  std::vector<CopyState> states(manifest.pieces.size(), CopyState::Missing);
  utils::run_indexed(manifest.pieces.size(), max_parallel_, [&](std::size_t position) {
    const PieceInfo& piece = manifest.pieces[position];
    try {
      Bytes data = store_.get(*piece.content_id);
      bool intact = data.size() == piece.size && crypto::Checksum::equal(checksum_.digest(data), piece.checksum);
      states[position] = intact ? CopyState::Intact : CopyState::Corrupted;
    } catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(debug) << "Reconstructor: Piece " << position << " unavailable: " << e.what();
      states[position] = CopyState::Missing;
    }
  });

  VerificationReport report;
  for (size_t position = 0; position < states.size(); ++position) {
    if (states[position] == CopyState::Corrupted) {
      report.corrupted.push_back(static_cast<uint32_t>(position));
    } else if (states[position] == CopyState::Missing) {
      report.missing.push_back(static_cast<uint32_t>(position));
    }
  }

  report.recoverable = true;
  for (uint32_t i = 0; i < manifest.piece_count; ++i) {
    bool has_intact = false;
    for (uint32_t round = 0; round < manifest.replication_factor && !has_intact; ++round) {
      has_intact = states[static_cast<size_t>(manifest.piece_count) * round + i] == CopyState::Intact;
    }
    if (!has_intact) {
      report.recoverable = false;
      break;
    }
  }
  report.valid = report.corrupted.empty() && report.missing.empty();

  BOOST_LOG_TRIVIAL(info) << "Reconstructor: Verification finished, " << report.corrupted.size() << " corrupted, "
                          << report.missing.size() << " missing";
  return report;
}

} // namespace shardpack::sharding
