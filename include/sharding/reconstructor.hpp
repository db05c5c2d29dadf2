#ifndef SHARDPACK_SHARDING_RECONSTRUCTOR_HPP
#define SHARDPACK_SHARDING_RECONSTRUCTOR_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "common/types.hpp"
#include "crypto/checksum.hpp"
#include "sharding/manifest.hpp"
#include "sharding/sharding_error.hpp"
#include "store/content_store.hpp"

namespace shardpack::sharding {

// Piece-level health of a stored object. corrupted and missing hold positions
// in the replicated piece set.
struct VerificationReport {
  bool valid = false;          // every stored copy is intact
  bool recoverable = false;    // every primary index has at least one intact copy
  std::vector<uint32_t> corrupted;
  std::vector<uint32_t> missing;
};

class Reconstructor {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Reconstructor(store::ContentStore& store, const crypto::Checksum& checksum, std::size_t max_parallel = 1);


  // ---- RECONSTRUCTION ----
  // Fetches and verifies every primary, falling back to replicas in order,
  // then checks the reassembled bytes against originalChecksum.
  // Throws MalformedManifestError, ShardRecoveryError, ManifestIntegrityError,
  // or store::NotFoundError when a piece without replicas is absent.
  Bytes reconstruct(const Manifest& manifest) const;

  // Fetches every stored copy and reports which ones are damaged. Piece
  // failures are reported, not thrown.
  VerificationReport verify(const Manifest& manifest) const;

private:
  // ---- PARAMETERS ----
  store::ContentStore& store_;
  const crypto::Checksum& checksum_;
  std::size_t max_parallel_;


  // ---- PIECE RECOVERY ----
  Bytes recover_piece(const Manifest& manifest, uint32_t index) const;
};

} // namespace shardpack::sharding

#endif // SHARDPACK_SHARDING_RECONSTRUCTOR_HPP
