#include "archive/compression.hpp"
#include <cstring>
#include <limits>
#include <string>
#include <zlib.h>
#include <boost/log/trivial.hpp>

namespace shardpack::archive {

namespace {

// windowBits 15 plus 16 selects the gzip wrapper
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr size_t CHUNK_SIZE = 64 * 1024;

struct DeflateStream {
  z_stream stream;

  DeflateStream() {
    std::memset(&stream, 0, sizeof(stream));
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
      throw ArchiveError("Compression: Failed to initialize deflate");
    }
  }
  ~DeflateStream() { deflateEnd(&stream); }

  DeflateStream(const DeflateStream&) = delete;
  DeflateStream& operator=(const DeflateStream&) = delete;
};

struct InflateStream {
  z_stream stream;

  InflateStream() {
    std::memset(&stream, 0, sizeof(stream));
    if (inflateInit2(&stream, GZIP_WINDOW_BITS) != Z_OK) {
      throw ArchiveError("Compression: Failed to initialize inflate");
    }
  }
  ~InflateStream() { inflateEnd(&stream); }

  InflateStream(const InflateStream&) = delete;
  InflateStream& operator=(const InflateStream&) = delete;
};

} // namespace

bool is_gzip(const Bytes& data) {
  return data.size() >= 2 && data[0] == 0x1f && data[1] == 0x8b;
}

Bytes gzip_compress(const Bytes& data) {
  if (data.size() > std::numeric_limits<uInt>::max()) {
    throw ArchiveError("Compression: Input too large");
  }

  DeflateStream deflater;
  Bytes output(deflateBound(&deflater.stream, static_cast<uLong>(data.size())));

  deflater.stream.next_in = const_cast<Bytef*>(data.data());
  deflater.stream.avail_in = static_cast<uInt>(data.size());
  deflater.stream.next_out = output.data();
  deflater.stream.avail_out = static_cast<uInt>(output.size());

  int result = deflate(&deflater.stream, Z_FINISH);
  if (result != Z_STREAM_END) {
    BOOST_LOG_TRIVIAL(error) << "Compression: deflate failed with code " << result;
    throw ArchiveError("Compression: deflate failed");
  }

  output.resize(deflater.stream.total_out);
  BOOST_LOG_TRIVIAL(debug) << "Compression: Compressed " << data.size() << " bytes to " << output.size();
  return output;
}

Bytes gzip_decompress(const Bytes& data, size_t max_output) {
  if (data.size() > std::numeric_limits<uInt>::max()) {
    throw ArchiveParseError("Compressed input too large");
  }

  InflateStream inflater;
  inflater.stream.next_in = const_cast<Bytef*>(data.data());
  inflater.stream.avail_in = static_cast<uInt>(data.size());

  Bytes output;
  Bytes chunk(CHUNK_SIZE);
  int result = Z_OK;
  while (result != Z_STREAM_END) {
    inflater.stream.next_out = chunk.data();
    inflater.stream.avail_out = static_cast<uInt>(chunk.size());

    result = inflate(&inflater.stream, Z_NO_FLUSH);
    if (result != Z_OK && result != Z_STREAM_END) {
      BOOST_LOG_TRIVIAL(error) << "Compression: inflate failed with code " << result;
      throw ArchiveParseError("Corrupt gzip data");
    }

    const size_t produced = chunk.size() - inflater.stream.avail_out;
    if (produced > max_output - output.size()) {
      BOOST_LOG_TRIVIAL(error) << "Compression: Decompressed size exceeds limit of " << max_output << " bytes";
      throw ArchiveParseError("Decompressed size exceeds limit of " + std::to_string(max_output) + " bytes");
    }
    output.insert(output.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));

    // Input exhausted before the end of the gzip member
    if (result == Z_OK && inflater.stream.avail_in == 0 && inflater.stream.avail_out != 0) {
      throw ArchiveParseError("Truncated gzip data");
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Compression: Decompressed " << data.size() << " bytes to " << output.size();
  return output;
}

} // namespace shardpack::archive
