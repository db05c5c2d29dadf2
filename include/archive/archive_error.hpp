#ifndef SHARDPACK_ARCHIVE_ERROR_HPP
#define SHARDPACK_ARCHIVE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace shardpack::archive {

class ArchiveError : public std::runtime_error {
public:
  explicit ArchiveError(const std::string& message)
    : std::runtime_error(message) {}
};

// Truncated records, invalid metadata or corrupt compression
class ArchiveParseError : public ArchiveError {
public:
  explicit ArchiveParseError(const std::string& message)
    : ArchiveError("Archive parse error: " + message) {}
};

} // namespace shardpack::archive

#endif // SHARDPACK_ARCHIVE_ERROR_HPP
