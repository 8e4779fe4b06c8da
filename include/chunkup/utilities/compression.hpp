#ifndef CHUNKUP_COMPRESSION_HPP
#define CHUNKUP_COMPRESSION_HPP

#include <cstddef>
#include <string>
#include <vector>

#include <zlib.h>

namespace chunkup {

/// Codecs a chunk body can be sent with, ordered from least to most
/// preferred.
enum class ChunkCompression { Uncompressed, Gzip };

std::string ChunkCompressionToString(ChunkCompression compression);

/**
 * @brief Parse a codec name ("gzip", "none").
 * @throws std::invalid_argument for unknown names.
 */
ChunkCompression chunkCompressionFromString(const std::string &name);

/**
 * @brief Best codec out of the names a server advertises.
 *
 * Unknown names are ignored; an empty list means uncompressed.
 */
ChunkCompression selectCompression(const std::vector<std::string> &advertised);

/**
 * @brief Compress @p data into a single gzip member.
 * @param level zlib compression level.
 * @throws std::runtime_error if zlib reports an error.
 */
std::vector<std::byte> gzipCompress(const std::vector<std::byte> &data,
                                    int level = Z_DEFAULT_COMPRESSION);

/**
 * @brief Inflate a gzip stream.
 * @throws std::runtime_error on corrupt or truncated input.
 */
std::vector<std::byte> gzipDecompress(const std::byte *data, size_t size);

} // namespace chunkup

#endif // CHUNKUP_COMPRESSION_HPP
