#include "sharding/chunker.hpp"
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace shardpack::sharding {

//==============================================
// SPLITTING
//==============================================

std::vector<Bytes> Chunker::split(const Bytes& data, uint64_t piece_size, uint32_t max_pieces) {
  if (piece_size == 0) {
    throw std::invalid_argument("Chunker: Piece size must be positive");
  }

  const uint64_t piece_count = estimate_piece_count(data.size(), piece_size);
  BOOST_LOG_TRIVIAL(debug) << "Chunker: Splitting " << data.size() << " bytes into "
                           << piece_count << " pieces of " << piece_size << " bytes";

  if (piece_count > max_pieces) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: " << piece_count << " pieces exceeds maximum of " << max_pieces;
    throw TooManyPiecesError(piece_count, max_pieces);
  }

  std::vector<Bytes> pieces;
  pieces.reserve(static_cast<size_t>(piece_count));

  for (uint64_t offset = 0; offset < data.size(); offset += piece_size) {
    const uint64_t end = std::min<uint64_t>(offset + piece_size, data.size());
    pieces.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(offset),
                        data.begin() + static_cast<std::ptrdiff_t>(end));
    BOOST_LOG_TRIVIAL(trace) << "Chunker: Piece " << pieces.size() - 1 << " covers [" << offset << ", " << end << ")";
  }

  return pieces;
}

//==============================================
// SIZING
//==============================================

uint64_t Chunker::estimate_piece_count(uint64_t size, uint64_t piece_size) {
  if (piece_size == 0) {
    throw std::invalid_argument("Chunker: Piece size must be positive");
  }
  return size / piece_size + (size % piece_size != 0 ? 1 : 0);
}

uint64_t Chunker::optimal_piece_size(uint64_t size, uint32_t max_pieces) {
  if (max_pieces == 0) {
    throw std::invalid_argument("Chunker: Maximum piece count must be positive");
  }

  const uint64_t needed = estimate_piece_count(size, max_pieces);
  const uint64_t clamped = std::clamp(needed, MIN_PIECE_SIZE, MAX_PIECE_SIZE);

  uint64_t piece_size = 1;
  while (piece_size < clamped) {
    piece_size <<= 1;
  }
  return piece_size;
}

} // namespace shardpack::sharding
