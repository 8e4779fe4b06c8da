#include "chunkup/upload/types.hpp"

#include <utility>

namespace chunkup {

std::string ArtifactKindToString(ArtifactKind kind) {
  switch (kind) {
  case ArtifactKind::DebugFile:
    return "debug_file";
  case ArtifactKind::SourceFile:
    return "source_file";
  case ArtifactKind::SourceBundle:
    return "source_bundle";
  case ArtifactKind::ArtifactBundle:
    return "artifact_bundle";
  default:
    return "other";
  }
}

std::string AssemblyStatusToString(AssemblyStatus status) {
  switch (status) {
  case AssemblyStatus::Pending:
    return "pending";
  case AssemblyStatus::InProgress:
    return "in_progress";
  case AssemblyStatus::Ok:
    return "ok";
  case AssemblyStatus::Error:
    return "error";
  case AssemblyStatus::NotFound:
    return "not_found";
  }
  return "unknown";
}

Artifact Artifact::fromBytes(std::string name, std::vector<std::byte> bytes,
                             ArtifactKind kind) {
  Artifact a;
  a.displayName = std::move(name);
  a.sizeBytes = bytes.size();
  a.kind = kind;
  a.contents =
      std::make_shared<const std::vector<std::byte>>(std::move(bytes));
  return a;
}

std::vector<Digest> ChunkedArtifact::chunkChecksums() const {
  std::vector<Digest> out;
  out.reserve(chunks.size());
  for (const auto &c : chunks)
    out.push_back(c.checksum);
  return out;
}

} // namespace chunkup
