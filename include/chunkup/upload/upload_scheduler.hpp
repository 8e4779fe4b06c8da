#ifndef CHUNKUP_UPLOAD_SCHEDULER_HPP
#define CHUNKUP_UPLOAD_SCHEDULER_HPP

#include "chunkup/transport/http.hpp"
#include "chunkup/upload/chunk_index.hpp"
#include "chunkup/upload/types.hpp"
#include "chunkup/utilities/backoff.hpp"
#include "chunkup/utilities/cancellation.hpp"
#include "chunkup/utilities/compression.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace chunkup {

/// Work item for one distinct missing chunk.
struct UploadTask {
  enum class State { Queued, InFlight, Done, Failed };

  Digest checksum{};
  unsigned retryCount{0};
  State state{State::Queued};
};

/// Reads the bytes of an indexed chunk back from its artifact.
using ChunkReader = std::function<std::vector<std::byte>(const ChunkLocation &)>;

struct SchedulerOptions {
  unsigned concurrency{8};
  std::string uploadPath;
  RetryPolicy retry;
  ChunkCompression compression{ChunkCompression::Uncompressed};
};

struct UploadReport {
  size_t uploaded{0};
  /// Tasks dropped because another worker already owned the checksum.
  size_t skipped{0};
  uint64_t bytesUploaded{0};
  size_t retries{0};
  std::vector<Digest> failedChunks;
  /// Failure reason per owning artifact.
  std::map<ArtifactId, std::string> failedArtifacts;
  bool cancelled{false};
};

/**
 * @brief Bounded worker pool uploading missing chunks.
 *
 * Every worker holds at most one chunk in memory and one request in flight.
 * Bytes read back are re-hashed so a file that changed since chunking fails
 * its chunk instead of uploading content under the wrong name. Transient
 * failures are retried with exponential backoff; a chunk that
 * exhausts its attempts fails only the artifacts that own it.
 */
class UploadScheduler {
public:
  UploadScheduler(http::Transport &transport, ChunkIndex &index,
                  ChunkReader reader, SchedulerOptions options,
                  CancellationToken token = {}, ProgressSink progress = {});

  /**
   * @brief Upload every checksum in @p missing that is still unclaimed.
   *
   * Blocks until the queue is drained or the token is cancelled.
   */
  UploadReport run(const std::vector<Digest> &missing);

private:
  void workerLoop(std::deque<UploadTask> &queue, std::mutex &mutex,
                  UploadReport &report);
  void process(UploadTask &task, std::mutex &mutex, UploadReport &report);
  void recordFailure(const Digest &checksum, const std::string &reason,
                     std::mutex &mutex, UploadReport &report);
  void emit(const ProgressEvent &event) const;

  http::Transport &transport_;
  ChunkIndex &index_;
  ChunkReader reader_;
  SchedulerOptions options_;
  CancellationToken token_;
  ProgressSink progress_;
};

} // namespace chunkup

#endif // CHUNKUP_UPLOAD_SCHEDULER_HPP
