#include "chunkup/upload/result.hpp"
#include "chunkup/utilities/logger.h"

#include <algorithm>
#include <sstream>

namespace chunkup {

std::string ArtifactOutcomeToString(ArtifactOutcome outcome) {
  switch (outcome) {
  case ArtifactOutcome::Ok:
    return "ok";
  case ArtifactOutcome::Pending:
    return "pending";
  case ArtifactOutcome::Error:
    return "error";
  case ArtifactOutcome::ChunkUploadFailed:
    return "chunk_upload_failed";
  case ArtifactOutcome::NotFound:
    return "not_found";
  case ArtifactOutcome::ChecksumMismatch:
    return "checksum_mismatch";
  case ArtifactOutcome::ProtocolError:
    return "protocol_error";
  case ArtifactOutcome::IoError:
    return "io_error";
  case ArtifactOutcome::SkippedTooLarge:
    return "skipped_too_large";
  case ArtifactOutcome::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

size_t BatchResult::count(ArtifactOutcome outcome) const {
  return static_cast<size_t>(
      std::count_if(artifacts.begin(), artifacts.end(),
                    [outcome](const ArtifactResult &r) {
                      return r.outcome == outcome;
                    }));
}

bool ResultAggregator::isFailure(ArtifactOutcome outcome, bool strictWait) {
  switch (outcome) {
  case ArtifactOutcome::Ok:
  case ArtifactOutcome::SkippedTooLarge:
    return false;
  case ArtifactOutcome::Pending:
    return strictWait;
  default:
    return true;
  }
}

BatchResult ResultAggregator::finalize(std::chrono::milliseconds elapsed) const {
  BatchResult out;
  out.artifacts = results_;
  std::sort(out.artifacts.begin(), out.artifacts.end(),
            [](const ArtifactResult &a, const ArtifactResult &b) {
              return a.id < b.id;
            });
  out.chunks = stats_;
  out.elapsed = elapsed;
  out.cancelled = cancelled_;
  out.failed = cancelled_;
  for (const auto &r : out.artifacts) {
    if (isFailure(r.outcome, strictWait_))
      out.failed = true;
  }
  out.exitCode = out.failed ? 1 : 0;

  Logger::getInstance().log(out.failed ? LogLevel::WARN : LogLevel::INFO,
                            summarize(out));
  return out;
}

std::string summarize(const BatchResult &result) {
  static const ArtifactOutcome kOrder[] = {
      ArtifactOutcome::Ok,
      ArtifactOutcome::Pending,
      ArtifactOutcome::Error,
      ArtifactOutcome::ChunkUploadFailed,
      ArtifactOutcome::NotFound,
      ArtifactOutcome::ChecksumMismatch,
      ArtifactOutcome::ProtocolError,
      ArtifactOutcome::IoError,
      ArtifactOutcome::SkippedTooLarge,
      ArtifactOutcome::Cancelled};

  std::ostringstream oss;
  oss << result.artifacts.size() << " artifact(s):";
  bool first = true;
  for (ArtifactOutcome o : kOrder) {
    size_t n = result.count(o);
    if (n == 0)
      continue;
    oss << (first ? " " : ", ") << n << " " << ArtifactOutcomeToString(o);
    first = false;
  }
  oss << "; chunks " << result.chunks.uploaded << " uploaded, "
      << result.chunks.deduplicated << " deduplicated, "
      << result.chunks.failed << " failed of " << result.chunks.total
      << "; " << result.chunks.bytesUploaded << " bytes in "
      << result.elapsed.count() << "ms";
  if (result.cancelled)
    oss << " (cancelled)";
  return oss.str();
}

} // namespace chunkup
