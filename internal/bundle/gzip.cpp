#include "internal/bundle/gzip.hpp"

#include <zlib.h>

#include <stdexcept>

namespace runvault::bundle {
namespace {

// 15 window bits, +16 selects the gzip wrapper
constexpr int kGzipWindowBits = 15 + 16;
constexpr size_t kChunkSize   = 64 * 1024;

std::string ZlibError(const char* op, int rc, const z_stream& stream) {
  return std::string(op) + " failed (" + std::to_string(rc) + ")" + (stream.msg ? std::string(": ") + stream.msg : "");
}

} // namespace

std::string GzipCompress(const std::string& data, int level) {
  z_stream stream{};
  int      rc = deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) {
    throw std::runtime_error(ZlibError("deflateInit2", rc, stream));
  }

  stream.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());

  std::string out;
  char        buffer[kChunkSize];
  do {
    stream.next_out  = reinterpret_cast<Bytef*>(buffer);
    stream.avail_out = sizeof(buffer);
    rc               = deflate(&stream, Z_FINISH);
    if (rc == Z_STREAM_ERROR) {
      deflateEnd(&stream);
      throw std::runtime_error(ZlibError("deflate", rc, stream));
    }
    out.append(buffer, sizeof(buffer) - stream.avail_out);
  } while (rc != Z_STREAM_END);

  deflateEnd(&stream);
  return out;
}

std::string GzipDecompress(const std::string& data) {
  z_stream stream{};
  int      rc = inflateInit2(&stream, kGzipWindowBits);
  if (rc != Z_OK) {
    throw std::runtime_error(ZlibError("inflateInit2", rc, stream));
  }

  stream.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());

  std::string out;
  char        buffer[kChunkSize];
  do {
    stream.next_out  = reinterpret_cast<Bytef*>(buffer);
    stream.avail_out = sizeof(buffer);
    rc               = inflate(&stream, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      std::string message = ZlibError("inflate", rc, stream);
      inflateEnd(&stream);
      throw std::runtime_error(message);
    }
    out.append(buffer, sizeof(buffer) - stream.avail_out);
    if (rc != Z_STREAM_END && stream.avail_in == 0 && stream.avail_out != 0) {
      inflateEnd(&stream);
      throw std::runtime_error("inflate failed: truncated gzip stream");
    }
  } while (rc != Z_STREAM_END);

  inflateEnd(&stream);
  return out;
}

} // namespace runvault::bundle
