#include "chunkup/upload/upload_scheduler.hpp"
#include "chunkup/upload/errors.hpp"
#include "chunkup/upload/retry.hpp"
#include "chunkup/upload/wire.hpp"
#include "chunkup/utilities/digest.hpp"
#include "chunkup/utilities/logger.h"
#include "chunkup/utilities/metrics.h"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <stdexcept>
#include <utility>

namespace chunkup {

namespace {

// Keeps chunkup_upload_inflight accurate on every exit path.
struct InflightGuard {
  InflightGuard() {
    MetricsRegistry::instance().addGauge("chunkup_upload_inflight", 1);
  }
  ~InflightGuard() {
    MetricsRegistry::instance().addGauge("chunkup_upload_inflight", -1);
  }
};

} // namespace

UploadScheduler::UploadScheduler(http::Transport &transport, ChunkIndex &index,
                                 ChunkReader reader, SchedulerOptions options,
                                 CancellationToken token,
                                 ProgressSink progress)
    : transport_(transport), index_(index), reader_(std::move(reader)),
      options_(std::move(options)), token_(std::move(token)),
      progress_(std::move(progress)) {
  if (options_.concurrency == 0)
    options_.concurrency = 1;
}

void UploadScheduler::emit(const ProgressEvent &event) const {
  if (progress_)
    progress_(event);
}

UploadReport UploadScheduler::run(const std::vector<Digest> &missing) {
  UploadReport report;
  std::deque<UploadTask> queue;
  std::set<Digest> seen;
  for (const auto &d : missing) {
    if (!index_.contains(d)) {
      Logger::getInstance().log(LogLevel::WARN, "Ignoring unindexed chunk " +
                                                    digestToHex(d));
      continue;
    }
    if (seen.insert(d).second)
      queue.push_back(UploadTask{d, 0, UploadTask::State::Queued});
  }
  if (queue.empty())
    return report;

  std::mutex mutex;
  const auto workers = static_cast<unsigned>(
      std::min<size_t>(options_.concurrency, queue.size()));
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Uploading " + std::to_string(queue.size()) +
                                " chunks with " + std::to_string(workers) +
                                " workers");

  boost::asio::thread_pool pool(workers);
  for (unsigned i = 0; i < workers; ++i) {
    boost::asio::post(pool,
                      [this, &queue, &mutex, &report] {
                        workerLoop(queue, mutex, report);
                      });
  }
  pool.join();
  return report;
}

void UploadScheduler::workerLoop(std::deque<UploadTask> &queue,
                                 std::mutex &mutex, UploadReport &report) {
  while (true) {
    UploadTask task;
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (queue.empty())
        return;
      if (token_.isCancelled()) {
        report.cancelled = true;
        return;
      }
      task = queue.front();
      queue.pop_front();
    }
    process(task, mutex, report);
  }
}

void UploadScheduler::process(UploadTask &task, std::mutex &mutex,
                              UploadReport &report) {
  const Digest &checksum = task.checksum;
  if (!index_.tryClaim(checksum)) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      ++report.skipped;
    }
    ProgressEvent ev;
    ev.type = ProgressEvent::Type::ChunkSkipped;
    ev.chunk = checksum;
    emit(ev);
    return;
  }

  task.state = UploadTask::State::InFlight;
  InflightGuard inflight;
  try {
    ChunkLocation loc = index_.location(checksum);
    std::vector<std::byte> data = reader_(loc);
    const std::string hex = digestToHex(checksum);
    Digest actual = sha1(data.data(), data.size());
    if (actual != checksum) {
      ThrowUploadException(ErrorKind::ChecksumMismatch,
                           "chunk " + hex + " changed on disk, now hashes to " +
                               digestToHex(actual));
    }

    const std::string boundary = "----chunkup" + hex;
    http::Request req;
    req.method = http::HttpMethod::POST;
    req.path = options_.uploadPath;
    req.headers["Content-Type"] = wire::multipartContentType(boundary);
    if (options_.compression == ChunkCompression::Gzip) {
      req.body = wire::encodeMultipartChunk(boundary, checksum,
                                            gzipCompress(data),
                                            options_.compression);
    } else {
      req.body = wire::encodeMultipartChunk(boundary, checksum, data);
    }

    RetryOutcome r = sendWithRetry(transport_, req, options_.retry, token_,
                                   http::IsTransientStatus);
    task.retryCount = r.attempts - 1;
    if (task.retryCount > 0) {
      MetricsRegistry::instance().incrementCounter(
          "chunkup_chunk_upload_retries_total", task.retryCount);
    }

    if (r.response.isSuccess()) {
      index_.markPresent(checksum);
      task.state = UploadTask::State::Done;
      {
        std::lock_guard<std::mutex> lock(mutex);
        ++report.uploaded;
        report.bytesUploaded += data.size();
        report.retries += task.retryCount;
      }
      auto &metrics = MetricsRegistry::instance();
      metrics.incrementCounter("chunkup_chunks_uploaded_total");
      metrics.observe("chunkup_chunk_upload_bytes",
                      static_cast<double>(data.size()));

      ProgressEvent ev;
      ev.type = ProgressEvent::Type::BytesTransferred;
      ev.artifact = loc.artifact;
      ev.chunk = checksum;
      ev.bytes = data.size();
      emit(ev);
      return;
    }

    int status = r.response.status;
    std::string reason =
        http::IsRedirectStatus(status)
            ? "redirected with HTTP " + std::to_string(status) +
                  ", project not found or URL misconfigured"
            : "HTTP " + std::to_string(status) + " " +
                  http::ReasonPhrase(status) + " after " +
                  std::to_string(r.attempts) + " attempt(s)";
    {
      std::lock_guard<std::mutex> lock(mutex);
      report.retries += task.retryCount;
    }
    task.state = UploadTask::State::Failed;
    recordFailure(checksum, reason, mutex, report);
  } catch (const UploadException &e) {
    if (e.kind() == ErrorKind::Cancelled) {
      // Give the chunk back so a later run can claim it.
      index_.markMissing(checksum);
      std::lock_guard<std::mutex> lock(mutex);
      report.cancelled = true;
      return;
    }
    task.state = UploadTask::State::Failed;
    recordFailure(checksum, e.what(), mutex, report);
  } catch (const http::TransportError &e) {
    task.state = UploadTask::State::Failed;
    recordFailure(checksum, e.what(), mutex, report);
  } catch (const std::exception &e) {
    task.state = UploadTask::State::Failed;
    recordFailure(checksum, e.what(), mutex, report);
  }
}

void UploadScheduler::recordFailure(const Digest &checksum,
                                    const std::string &reason,
                                    std::mutex &mutex, UploadReport &report) {
  index_.markFailed(checksum);
  MetricsRegistry::instance().incrementCounter(
      "chunkup_chunk_upload_failures_total");
  const std::string hex = digestToHex(checksum);
  Logger::getInstance().log(LogLevel::ERROR,
                            "Chunk " + hex + " failed: " + reason);

  std::set<ArtifactId> owners;
  try {
    owners = index_.owners(checksum);
  } catch (const std::out_of_range &e) {
    Logger::getInstance().log(LogLevel::ERROR, e.what());
  }
  std::lock_guard<std::mutex> lock(mutex);
  report.failedChunks.push_back(checksum);
  for (ArtifactId id : owners) {
    report.failedArtifacts.emplace(id, "chunk " + hex + " failed: " + reason);
  }
}

} // namespace chunkup
