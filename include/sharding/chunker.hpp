#ifndef SHARDPACK_SHARDING_CHUNKER_HPP
#define SHARDPACK_SHARDING_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "common/types.hpp"
#include "sharding/sharding_error.hpp"

namespace shardpack::sharding {

class Chunker {
public:
  static constexpr uint64_t MIN_PIECE_SIZE = 256 * 1024;
  static constexpr uint64_t MAX_PIECE_SIZE = 32 * 1024 * 1024;

  // ---- SPLITTING ----
  // Splits data into consecutive windows of piece_size bytes, the last one
  // possibly shorter. Throws TooManyPiecesError before copying anything when
  // more than max_pieces windows would be produced, std::invalid_argument
  // when piece_size is zero.
  static std::vector<Bytes> split(const Bytes& data, uint64_t piece_size, uint32_t max_pieces);


  // ---- SIZING ----
  // ceil(size / piece_size)
  static uint64_t estimate_piece_count(uint64_t size, uint64_t piece_size);
  // Smallest power of two that fits size into max_pieces pieces, clamped to
  // [MIN_PIECE_SIZE, MAX_PIECE_SIZE]
  static uint64_t optimal_piece_size(uint64_t size, uint32_t max_pieces);
};

} // namespace shardpack::sharding

#endif // SHARDPACK_SHARDING_CHUNKER_HPP
