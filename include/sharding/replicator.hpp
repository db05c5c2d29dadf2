#ifndef SHARDPACK_SHARDING_REPLICATOR_HPP
#define SHARDPACK_SHARDING_REPLICATOR_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include "common/types.hpp"

namespace shardpack::sharding {

// One entry of the replicated piece set. Replicas share the primary's buffer.
struct Piece {
  uint32_t index;                        // position in the replicated set
  std::shared_ptr<const Bytes> data;
};

class Replicator {
public:
  // Returns the primaries at indices [0, n) followed by factor - 1 full copies,
  // round r occupying [n * r, n * (r + 1)). Throws std::invalid_argument when
  // factor is zero.
  static std::vector<Piece> replicate(std::vector<Bytes> pieces, uint32_t factor);
};

} // namespace shardpack::sharding

#endif // SHARDPACK_SHARDING_REPLICATOR_HPP
