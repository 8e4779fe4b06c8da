#ifndef CHUNKUP_RESULT_HPP
#define CHUNKUP_RESULT_HPP

#include "chunkup/upload/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chunkup {

/// Final disposition of one artifact.
enum class ArtifactOutcome {
  Ok,
  Pending,
  Error,
  ChunkUploadFailed,
  NotFound,
  ChecksumMismatch,
  ProtocolError,
  IoError,
  SkippedTooLarge,
  Cancelled
};

std::string ArtifactOutcomeToString(ArtifactOutcome outcome);

struct ArtifactResult {
  ArtifactId id{0};
  std::string name;
  std::optional<Digest> checksum;
  ArtifactOutcome outcome{ArtifactOutcome::Pending};
  AssemblyStatus lastStatus{AssemblyStatus::Pending};
  std::string detail;
};

struct ChunkStats {
  /// Distinct chunks in the batch.
  size_t total{0};
  /// Chunk references across all artifacts, before local dedup.
  size_t referenced{0};
  size_t uploaded{0};
  /// Distinct chunks the server already had.
  size_t deduplicated{0};
  size_t failed{0};
  uint64_t bytesUploaded{0};
};

struct BatchResult {
  std::vector<ArtifactResult> artifacts;
  ChunkStats chunks;
  std::chrono::milliseconds elapsed{0};
  bool cancelled{false};
  bool failed{false};
  int exitCode{0};

  size_t count(ArtifactOutcome outcome) const;
};

/**
 * @brief Folds per-artifact outcomes into a BatchResult.
 *
 * The batch fails when any artifact failed. Pending counts as success
 * unless strict waiting was requested; skipped artifacts only warn.
 */
class ResultAggregator {
public:
  explicit ResultAggregator(bool strictWait = false)
      : strictWait_(strictWait) {}

  static bool isFailure(ArtifactOutcome outcome, bool strictWait);

  void add(ArtifactResult result) { results_.push_back(std::move(result)); }
  void setChunkStats(const ChunkStats &stats) { stats_ = stats; }
  void setCancelled(bool cancelled) { cancelled_ = cancelled; }

  /// Build the result and log a one-line summary.
  BatchResult finalize(std::chrono::milliseconds elapsed) const;

private:
  bool strictWait_;
  bool cancelled_{false};
  ChunkStats stats_;
  std::vector<ArtifactResult> results_;
};

/// "3 ok, 1 pending, ..." style summary used in logs.
std::string summarize(const BatchResult &result);

} // namespace chunkup

#endif // CHUNKUP_RESULT_HPP
