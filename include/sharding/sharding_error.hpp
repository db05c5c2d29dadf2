#ifndef SHARDPACK_SHARDING_ERROR_HPP
#define SHARDPACK_SHARDING_ERROR_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include "common/types.hpp"

namespace shardpack::sharding {

class ShardingError : public std::runtime_error {
public:
  explicit ShardingError(const std::string& message)
    : std::runtime_error(message) {}
};

class TooManyPiecesError : public ShardingError {
public:
  TooManyPiecesError(uint64_t piece_count, uint32_t max_pieces)
    : ShardingError("Too many pieces: " + std::to_string(piece_count) +
                        " exceeds maximum of " + std::to_string(max_pieces))
    , piece_count_(piece_count)
    , max_pieces_(max_pieces) {}

  uint64_t piece_count() const { return piece_count_; }
  uint32_t max_pieces() const { return max_pieces_; }

private:
  uint64_t piece_count_;
  uint32_t max_pieces_;
};

// Why the last copy of a piece was rejected
enum class ShardFailure {
  ChecksumMismatch,
  Unavailable
};

inline const char* to_string(ShardFailure failure) {
  switch (failure) {
    case ShardFailure::ChecksumMismatch: return "checksum-mismatch";
    case ShardFailure::Unavailable:      return "unavailable";
  }
  return "unknown";
}

// No stored copy of a piece matched its recorded checksum
class ShardRecoveryError : public ShardingError {
public:
  ShardRecoveryError(uint32_t index, ShardFailure failure, std::size_t attempts, const Digest& expected_checksum)
    : ShardingError("Failed to recover piece " + std::to_string(index) + " after " +
                        std::to_string(attempts) + " attempt(s): " + to_string(failure))
    , index_(index)
    , failure_(failure)
    , attempts_(attempts)
    , expected_checksum_(expected_checksum) {}

  uint32_t index() const { return index_; }
  ShardFailure failure() const { return failure_; }
  std::size_t attempts() const { return attempts_; }
  const Digest& expected_checksum() const { return expected_checksum_; }

private:
  uint32_t index_;
  ShardFailure failure_;
  std::size_t attempts_;
  Digest expected_checksum_;
};

// Reassembled bytes do not hash to the manifest's originalChecksum
class ManifestIntegrityError : public ShardingError {
public:
  ManifestIntegrityError(const Digest& expected, const Digest& actual)
    : ShardingError("Object checksum mismatch: expected " + expected + ", got " + actual)
    , expected_(expected)
    , actual_(actual) {}

  const Digest& expected() const { return expected_; }
  const Digest& actual() const { return actual_; }

private:
  Digest expected_;
  Digest actual_;
};

class MalformedManifestError : public ShardingError {
public:
  explicit MalformedManifestError(const std::string& message)
    : ShardingError("Malformed manifest: " + message) {}
};

} // namespace shardpack::sharding

#endif // SHARDPACK_SHARDING_ERROR_HPP
