#ifndef CHUNKUP_CHUNKER_HPP
#define CHUNKUP_CHUNKER_HPP

#include "chunkup/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace chunkup {

/**
 * @brief Fixed-size, byte-offset chunking of artifacts.
 *
 * The same bytes and the same chunk size always produce the same ordered
 * checksum list. Files are streamed so at most one chunk is resident per
 * call.
 */
class Chunker {
public:
  /// 8 MiB, the server's customary chunk size.
  static constexpr uint64_t DEFAULT_CHUNK_SIZE = 8ull * 1024 * 1024;

  /**
   * @param chunkSize Upper bound on chunk length in bytes.
   * @throw std::invalid_argument if @p chunkSize is zero.
   */
  explicit Chunker(uint64_t chunkSize = DEFAULT_CHUNK_SIZE);

  uint64_t chunkSize() const { return chunkSize_; }

  /**
   * @brief Split an artifact into chunks and compute all checksums.
   *
   * An empty artifact yields zero chunks and the checksum of the empty
   * string.
   * @throw UploadException (Io) if the file cannot be read.
   */
  ChunkedArtifact chunk(ArtifactId id, const Artifact &artifact) const;

  /// Chunk an in-memory buffer.
  ChunkedArtifact chunkBytes(ArtifactId id, const std::byte *data,
                             size_t size) const;

  /**
   * @brief Size of an artifact's contents in bytes.
   *
   * In-memory contents win, then the file size on disk.
   * @throw UploadException (Io) if the file cannot be inspected.
   */
  static uint64_t measure(const Artifact &artifact);

  /**
   * @brief Read back @p length bytes at @p offset.
   * @throw UploadException (Io) on short reads or missing files.
   */
  static std::vector<std::byte> readRange(const Artifact &artifact,
                                          uint64_t offset, uint64_t length);

private:
  uint64_t chunkSize_;
};

} // namespace chunkup

#endif // CHUNKUP_CHUNKER_HPP
