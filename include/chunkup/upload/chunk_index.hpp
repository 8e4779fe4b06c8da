#ifndef CHUNKUP_CHUNK_INDEX_HPP
#define CHUNKUP_CHUNK_INDEX_HPP

#include "chunkup/upload/types.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <unordered_map>
#include <vector>

namespace chunkup {

/// Lifecycle of one distinct chunk within a batch.
enum class ChunkState : int { Missing, Uploading, Present, Failed };

/**
 * @brief Batch-wide, checksum-keyed and deduplicated chunk map.
 *
 * Entries are spread over independently locked shards so that concurrent
 * workers do not serialize on a single mutex. The state of every entry is an
 * atomic which supports the claim/upload/mark sequence without holding any
 * lock across the network call. Entries are never removed.
 */
class ChunkIndex {
public:
  explicit ChunkIndex(size_t shardCount = 16);

  ChunkIndex(const ChunkIndex &) = delete;
  ChunkIndex &operator=(const ChunkIndex &) = delete;

  /**
   * @brief Insert one chunk occurrence.
   * @return true if the checksum was not indexed yet.
   */
  bool insert(const Digest &checksum, const ChunkLocation &location,
              ArtifactId owner);

  /// Insert every chunk of @p artifact. Returns the number of new entries.
  size_t insertArtifact(const ChunkedArtifact &artifact);

  bool contains(const Digest &checksum) const;

  /// @throw std::out_of_range for unknown checksums.
  ChunkState state(const Digest &checksum) const;

  bool isPresent(const Digest &checksum) const;

  /**
   * @brief Atomically move a Missing chunk to Uploading.
   * @return true if the caller now owns the upload.
   */
  bool tryClaim(const Digest &checksum);

  void markPresent(const Digest &checksum);
  void markFailed(const Digest &checksum);

  /// Forget a previous outcome so the chunk can be claimed again.
  void markMissing(const Digest &checksum);

  std::set<ArtifactId> owners(const Digest &checksum) const;
  ChunkLocation location(const Digest &checksum) const;

  /// Number of distinct checksums.
  size_t size() const;
  size_t presentCount() const;
  std::vector<Digest> checksums() const;

private:
  struct Entry {
    ChunkLocation location;
    std::set<ArtifactId> owners;
    std::atomic<int> state{static_cast<int>(ChunkState::Missing)};
  };

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<Digest, std::unique_ptr<Entry>, DigestHash> entries;
  };

  Shard &shardFor(const Digest &checksum) const;
  Entry *find(const Digest &checksum) const;
  Entry &require(const Digest &checksum) const;

  std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace chunkup

#endif // CHUNKUP_CHUNK_INDEX_HPP
