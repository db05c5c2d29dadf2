#ifndef SHARDPACK_COMMON_TYPES_HPP
#define SHARDPACK_COMMON_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace shardpack {

// Raw object bytes as they move between the pipeline stages
using Bytes = std::vector<uint8_t>;

// Lowercase hex SHA-256 of a byte sequence
using Digest = std::string;

// Address of an object in a content store, derived from its bytes
using ContentId = std::string;

// Milliseconds since the Unix epoch, used for createdAt fields
inline uint64_t current_time_millis() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace shardpack

#endif // SHARDPACK_COMMON_TYPES_HPP
