#ifndef SHARDPACK_ARCHIVE_COMPRESSION_HPP
#define SHARDPACK_ARCHIVE_COMPRESSION_HPP

#include <cstddef>
#include <limits>
#include "common/types.hpp"
#include "archive/archive_error.hpp"

namespace shardpack::archive {

// True when data starts with the gzip magic 0x1f 0x8b
bool is_gzip(const Bytes& data);

// Wraps data in a single gzip member. Throws ArchiveError on zlib failure.
Bytes gzip_compress(const Bytes& data);

// Throws ArchiveParseError on corrupt or truncated gzip data, or once the
// output would grow past max_output bytes
Bytes gzip_decompress(const Bytes& data, size_t max_output = std::numeric_limits<size_t>::max());

} // namespace shardpack::archive

#endif // SHARDPACK_ARCHIVE_COMPRESSION_HPP
