#pragma once

#include <cstdint>
#include <string>
#include "common/types.hpp"

namespace shardpack {
namespace pipeline {

// Caller-side description of an object in the content store
struct ObjectRecord {
  ContentId id;                           // manifest id, accepted by download()
  std::string name;
  uint64_t size = 0;                      // plaintext bytes
  std::string mime_type = "application/octet-stream";
  uint64_t created_at = 0;
  bool encrypted = false;
  bool sharded = false;
  uint32_t piece_count = 0;
  bool verified = false;
  bool imported = false;
  ContentId stored_id;                    // id the store assigned
  ContentId source_id;                    // archive root id, imports only
};

} // namespace pipeline
} // namespace shardpack
