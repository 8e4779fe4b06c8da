#include "chunkup/utilities/compression.hpp"

#include <stdexcept>

namespace chunkup {

namespace {

// windowBits 15 plus 16 selects the gzip wrapper instead of zlib's.
constexpr int kGzipWindowBits = 15 + 16;

std::string zlibError(const char *what, int ret, const z_stream &stream) {
  std::string msg = std::string(what) + " failed (error " +
                    std::to_string(ret) + ")";
  if (stream.msg)
    msg += ": " + std::string(stream.msg);
  return msg;
}

} // namespace

std::string ChunkCompressionToString(ChunkCompression compression) {
  switch (compression) {
  case ChunkCompression::Gzip:
    return "gzip";
  default:
    return "none";
  }
}

ChunkCompression chunkCompressionFromString(const std::string &name) {
  if (name == "gzip")
    return ChunkCompression::Gzip;
  if (name == "none" || name == "uncompressed")
    return ChunkCompression::Uncompressed;
  throw std::invalid_argument("Unsupported chunk compression: " + name);
}

ChunkCompression selectCompression(const std::vector<std::string> &advertised) {
  ChunkCompression best = ChunkCompression::Uncompressed;
  for (const auto &name : advertised) {
    try {
      ChunkCompression c = chunkCompressionFromString(name);
      if (c > best)
        best = c;
    } catch (const std::invalid_argument &) {
      // Codec we cannot produce.
    }
  }
  return best;
}

std::vector<std::byte> gzipCompress(const std::vector<std::byte> &data,
                                    int level) {
  z_stream stream{};
  int ret = deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, 8,
                         Z_DEFAULT_STRATEGY);
  if (ret != Z_OK)
    throw std::runtime_error(zlibError("deflateInit2", ret, stream));

  std::vector<std::byte> out(
      deflateBound(&stream, static_cast<uLong>(data.size())));
  stream.next_in =
      reinterpret_cast<Bytef *>(const_cast<std::byte *>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());
  stream.next_out = reinterpret_cast<Bytef *>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());

  ret = deflate(&stream, Z_FINISH);
  if (ret != Z_STREAM_END) {
    std::string msg = zlibError("deflate", ret, stream);
    deflateEnd(&stream);
    throw std::runtime_error(msg);
  }
  out.resize(stream.total_out);
  deflateEnd(&stream);
  return out;
}

std::vector<std::byte> gzipDecompress(const std::byte *data, size_t size) {
  z_stream stream{};
  int ret = inflateInit2(&stream, kGzipWindowBits);
  if (ret != Z_OK)
    throw std::runtime_error(zlibError("inflateInit2", ret, stream));

  stream.next_in = reinterpret_cast<Bytef *>(const_cast<std::byte *>(data));
  stream.avail_in = static_cast<uInt>(size);

  std::vector<std::byte> out;
  std::byte buf[16384];
  do {
    stream.next_out = reinterpret_cast<Bytef *>(buf);
    stream.avail_out = sizeof(buf);
    ret = inflate(&stream, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      std::string msg = zlibError("inflate", ret, stream);
      inflateEnd(&stream);
      throw std::runtime_error(msg);
    }
    out.insert(out.end(), buf, buf + (sizeof(buf) - stream.avail_out));
    if (ret != Z_STREAM_END && stream.avail_in == 0 &&
        stream.avail_out != 0) {
      inflateEnd(&stream);
      throw std::runtime_error("inflate failed: truncated gzip stream");
    }
  } while (ret != Z_STREAM_END);
  inflateEnd(&stream);
  return out;
}

} // namespace chunkup
