#include "chunkup/upload/chunk_index.hpp"

#include <stdexcept>

namespace chunkup {

ChunkIndex::ChunkIndex(size_t shardCount) {
  if (shardCount == 0)
    shardCount = 1;
  shards_.reserve(shardCount);
  for (size_t i = 0; i < shardCount; ++i)
    shards_.push_back(std::make_unique<Shard>());
}

ChunkIndex::Shard &ChunkIndex::shardFor(const Digest &checksum) const {
  return *shards_[DigestHash{}(checksum) % shards_.size()];
}

ChunkIndex::Entry *ChunkIndex::find(const Digest &checksum) const {
  Shard &shard = shardFor(checksum);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(checksum);
  // Entries are heap allocated and never erased, so the pointer stays valid.
  return it == shard.entries.end() ? nullptr : it->second.get();
}

ChunkIndex::Entry &ChunkIndex::require(const Digest &checksum) const {
  Entry *e = find(checksum);
  if (!e) {
    throw std::out_of_range("Unknown chunk " + digestToHex(checksum));
  }
  return *e;
}

bool ChunkIndex::insert(const Digest &checksum, const ChunkLocation &location,
                        ArtifactId owner) {
  Shard &shard = shardFor(checksum);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(checksum);
  if (it != shard.entries.end()) {
    it->second->owners.insert(owner);
    return false;
  }
  auto entry = std::make_unique<Entry>();
  entry->location = location;
  entry->owners.insert(owner);
  shard.entries.emplace(checksum, std::move(entry));
  return true;
}

size_t ChunkIndex::insertArtifact(const ChunkedArtifact &artifact) {
  size_t added = 0;
  for (const auto &c : artifact.chunks) {
    if (insert(c.checksum, {artifact.id, c.offset, c.length}, artifact.id))
      ++added;
  }
  return added;
}

bool ChunkIndex::contains(const Digest &checksum) const {
  return find(checksum) != nullptr;
}

ChunkState ChunkIndex::state(const Digest &checksum) const {
  return static_cast<ChunkState>(require(checksum).state.load());
}

bool ChunkIndex::isPresent(const Digest &checksum) const {
  Entry *e = find(checksum);
  return e && e->state.load() == static_cast<int>(ChunkState::Present);
}

bool ChunkIndex::tryClaim(const Digest &checksum) {
  int expected = static_cast<int>(ChunkState::Missing);
  return require(checksum).state.compare_exchange_strong(
      expected, static_cast<int>(ChunkState::Uploading));
}

void ChunkIndex::markPresent(const Digest &checksum) {
  require(checksum).state.store(static_cast<int>(ChunkState::Present));
}

void ChunkIndex::markFailed(const Digest &checksum) {
  require(checksum).state.store(static_cast<int>(ChunkState::Failed));
}

void ChunkIndex::markMissing(const Digest &checksum) {
  require(checksum).state.store(static_cast<int>(ChunkState::Missing));
}

std::set<ArtifactId> ChunkIndex::owners(const Digest &checksum) const {
  Shard &shard = shardFor(checksum);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(checksum);
  if (it == shard.entries.end()) {
    throw std::out_of_range("Unknown chunk " + digestToHex(checksum));
  }
  return it->second->owners;
}

ChunkLocation ChunkIndex::location(const Digest &checksum) const {
  return require(checksum).location;
}

size_t ChunkIndex::size() const {
  size_t n = 0;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    n += shard->entries.size();
  }
  return n;
}

size_t ChunkIndex::presentCount() const {
  size_t n = 0;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    for (const auto &kv : shard->entries) {
      if (kv.second->state.load() == static_cast<int>(ChunkState::Present))
        ++n;
    }
  }
  return n;
}

std::vector<Digest> ChunkIndex::checksums() const {
  std::vector<Digest> out;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    for (const auto &kv : shard->entries)
      out.push_back(kv.first);
  }
  return out;
}

} // namespace chunkup
