#pragma once
#ifndef CHUNKUP_TYPES_HPP
#define CHUNKUP_TYPES_HPP

#include "chunkup/utilities/digest.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkup {

/// Position of an artifact in the batch handed to the uploader.
using ArtifactId = size_t;

enum class ArtifactKind { DebugFile, SourceFile, SourceBundle, ArtifactBundle, Other };

std::string ArtifactKindToString(ArtifactKind kind);

/**
 * @brief A single logical file to upload.
 *
 * Either @c localPath names a readable file, or @c contents holds the bytes
 * (bundles built in memory upstream). When @c checksum is set it is the
 * checksum computed by the producer and is verified against the bytes
 * before assembly.
 */
struct Artifact {
  std::string localPath;
  std::string displayName;
  uint64_t sizeBytes{0};
  std::optional<Digest> checksum;
  std::optional<std::string> debugId;
  ArtifactKind kind{ArtifactKind::Other};
  std::shared_ptr<const std::vector<std::byte>> contents;

  /// Convenience constructor for in-memory artifacts.
  static Artifact fromBytes(std::string name, std::vector<std::byte> bytes,
                            ArtifactKind kind = ArtifactKind::Other);
};

/// One slice of an artifact as produced by the Chunker.
struct ChunkRef {
  Digest checksum{};
  uint64_t offset{0};
  uint64_t length{0};
};

/// Where the bytes of an indexed chunk can be read back from.
struct ChunkLocation {
  ArtifactId artifact{0};
  uint64_t offset{0};
  uint64_t length{0};
};

/// Result of chunking one artifact.
struct ChunkedArtifact {
  ArtifactId id{0};
  Digest checksum{};
  uint64_t size{0};
  std::vector<ChunkRef> chunks;

  std::vector<Digest> chunkChecksums() const;
};

/// Assemble request payload for one artifact.
struct AssemblyManifest {
  ArtifactId artifact{0};
  Digest artifactChecksum{};
  std::vector<Digest> chunks;
  std::string name;
  std::optional<std::string> debugId;
  ArtifactKind kind{ArtifactKind::Other};
};

/// Server-side assembly state.
enum class AssemblyStatus { Pending, InProgress, Ok, Error, NotFound };

std::string AssemblyStatusToString(AssemblyStatus status);

inline bool IsTerminal(AssemblyStatus status) {
  return status == AssemblyStatus::Ok || status == AssemblyStatus::Error ||
         status == AssemblyStatus::NotFound;
}

/**
 * @brief Progress notification for presentation layers.
 *
 * Only the fields relevant to @c type are meaningful.
 */
struct ProgressEvent {
  enum class Type {
    BytesTransferred,      ///< a chunk of @c bytes was uploaded
    ChunkSkipped,          ///< @c chunk was not uploaded (known or claimed)
    ArtifactStatusChanged, ///< @c artifact moved to @c status
    ArtifactSkipped        ///< @c artifact was excluded, see @c detail
  };
  Type type{Type::BytesTransferred};
  ArtifactId artifact{0};
  Digest chunk{};
  uint64_t bytes{0};
  AssemblyStatus status{AssemblyStatus::Pending};
  std::string detail;
};

/// Invoked from worker threads; implementations must be thread-safe.
using ProgressSink = std::function<void(const ProgressEvent &)>;

} // namespace chunkup

#endif // CHUNKUP_TYPES_HPP
