#include "sharding/replicator.hpp"
#include <limits>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace shardpack::sharding {

std::vector<Piece> Replicator::replicate(std::vector<Bytes> pieces, uint32_t factor) {
  if (factor == 0) {
    throw std::invalid_argument("Replicator: Replication factor must be positive");
  }

  const uint64_t piece_count = pieces.size();
  if (piece_count * factor > std::numeric_limits<uint32_t>::max()) {
    throw std::invalid_argument("Replicator: Replicated piece set too large");
  }

  BOOST_LOG_TRIVIAL(debug) << "Replicator: Replicating " << piece_count << " pieces with factor " << factor;

  std::vector<std::shared_ptr<const Bytes>> primaries;
  primaries.reserve(pieces.size());
  for (auto& piece : pieces) {
    primaries.push_back(std::make_shared<const Bytes>(std::move(piece)));
  }

  std::vector<Piece> replicated;
  replicated.reserve(static_cast<size_t>(piece_count * factor));
  for (uint32_t round = 0; round < factor; ++round) {
    for (uint32_t i = 0; i < piece_count; ++i) {
      replicated.push_back(Piece{static_cast<uint32_t>(piece_count * round + i), primaries[i]});
    }
  }

  return replicated;
}

} // namespace shardpack::sharding
