#include "chunkup/upload/uploader.hpp"
#include "chunkup/upload/assemble.hpp"
#include "chunkup/upload/chunk_index.hpp"
#include "chunkup/upload/chunker.hpp"
#include "chunkup/upload/diff_query.hpp"
#include "chunkup/upload/errors.hpp"
#include "chunkup/upload/poll_loop.hpp"
#include "chunkup/upload/upload_scheduler.hpp"
#include "chunkup/utilities/logger.h"
#include "chunkup/utilities/metrics.h"

#include <boost/asio/post.hpp>
#include <algorithm>
#include <boost/asio/thread_pool.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <utility>

namespace chunkup {

namespace {

ArtifactOutcome outcomeForError(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Protocol:
    return ArtifactOutcome::ProtocolError;
  case ErrorKind::ChecksumMismatch:
    return ArtifactOutcome::ChecksumMismatch;
  case ErrorKind::Io:
    return ArtifactOutcome::IoError;
  case ErrorKind::Cancelled:
    return ArtifactOutcome::Cancelled;
  case ErrorKind::ChunkUploadFailed:
    return ArtifactOutcome::ChunkUploadFailed;
  case ErrorKind::LostAssembly:
    return ArtifactOutcome::NotFound;
  case ErrorKind::SizeLimit:
    return ArtifactOutcome::SkippedTooLarge;
  default:
    return ArtifactOutcome::Error;
  }
}

struct Slot {
  const Artifact *artifact{nullptr};
  ArtifactResult result;
  std::optional<ChunkedArtifact> chunked;
  std::optional<AssemblyManifest> manifest;
  bool done{false};
  bool restarted{false};
};

/// State of one uploadAndAssemble() call.
class BatchRun {
public:
  BatchRun(http::Transport &transport, const UploadConfig &config,
           const CancellationToken &token, const ProgressSink &progress,
           const std::vector<Artifact> &artifacts)
      : config_(config), token_(token), progress_(progress),
        artifacts_(artifacts),
        diff_(transport,
              DiffOptions{config.endpoints.chunkDiff,
                          config.endpoints.artifactDiff, config.diffPageSize,
                          config.retry},
              token),
        scheduler_(transport, index_,
                   [this](const ChunkLocation &loc) {
                     return Chunker::readRange(artifacts_[loc.artifact],
                                               loc.offset, loc.length);
                   },
                   SchedulerOptions{config.concurrency,
                                    config.endpoints.chunkUpload,
                                    config.retry, config.compression},
                   token, progress),
        coordinator_(transport,
                     AssembleOptions{config.endpoints.assemble,
                                     config.assembleBatchSize, config.retry},
                     token) {
    slots_.resize(artifacts.size());
    for (size_t i = 0; i < artifacts.size(); ++i) {
      const Artifact &a = artifacts[i];
      Slot &s = slots_[i];
      s.artifact = &a;
      s.result.id = i;
      s.result.name =
          a.displayName.empty()
              ? std::filesystem::path(a.localPath).filename().string()
              : a.displayName;
      s.result.checksum = a.checksum;
    }
  }

  BatchResult run() {
    auto start = std::chrono::steady_clock::now();
    Logger::getInstance().log(LogLevel::INFO,
                              "Uploading " +
                                  std::to_string(artifacts_.size()) +
                                  " artifact(s)");

    checkSizes();
    checkAccepted();
    chunkAll();
    buildManifests();
    indexChunks();
    if (!token_.isCancelled())
      uploadMissing();
    if (!token_.isCancelled())
      assemble();
    settleRemaining();

    // Fire-and-forget has nothing to be strict about: pending is accepted.
    ResultAggregator aggregator(config_.wait.strict &&
                                config_.wait.mode != WaitMode::FireAndForget);
    for (const auto &s : slots_)
      aggregator.add(s.result);
    aggregator.setChunkStats(stats_);
    aggregator.setCancelled(token_.isCancelled());
    return aggregator.finalize(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start));
  }

private:
  void emit(const ProgressEvent &ev) const {
    if (progress_)
      progress_(ev);
  }

  void finish(Slot &s, ArtifactOutcome outcome, const std::string &detail) {
    if (s.done)
      return;
    s.done = true;
    s.result.outcome = outcome;
    s.result.detail = detail;
    ProgressEvent ev;
    ev.type = outcome == ArtifactOutcome::SkippedTooLarge
                  ? ProgressEvent::Type::ArtifactSkipped
                  : ProgressEvent::Type::ArtifactStatusChanged;
    ev.artifact = s.result.id;
    ev.status = s.result.lastStatus;
    ev.detail = ArtifactOutcomeToString(outcome) +
                (detail.empty() ? "" : ": " + detail);
    emit(ev);
  }

  void setStatus(Slot &s, AssemblyStatus status) {
    if (s.result.lastStatus == status)
      return;
    s.result.lastStatus = status;
    ProgressEvent ev;
    ev.type = ProgressEvent::Type::ArtifactStatusChanged;
    ev.artifact = s.result.id;
    ev.status = status;
    emit(ev);
  }

  bool active(const Slot &s) const { return !s.done; }

  void checkSizes() {
    for (auto &s : slots_) {
      uint64_t size = 0;
      try {
        size = Chunker::measure(*s.artifact);
      } catch (const UploadException &e) {
        finish(s, ArtifactOutcome::IoError, e.what());
        continue;
      }
      if (size > config_.maxFileSize) {
        std::string msg = s.result.name + " is " + std::to_string(size) +
                          " bytes, above the limit of " +
                          std::to_string(config_.maxFileSize) +
                          " bytes; skipping";
        Logger::getInstance().log(LogLevel::WARN, msg);
        finish(s, ArtifactOutcome::SkippedTooLarge, msg);
      }
    }
  }

  // Kinds the server did not list in its accept set are never uploaded.
  void checkAccepted() {
    const auto &accepted = config_.acceptedCapabilities;
    if (accepted.empty())
      return;
    for (auto &s : slots_) {
      if (!active(s))
        continue;
      std::string capability = wire::capabilityFor(s.artifact->kind);
      if (capability.empty() ||
          std::find(accepted.begin(), accepted.end(), capability) !=
              accepted.end())
        continue;
      std::string msg = "server does not accept " +
                        ArtifactKindToString(s.artifact->kind) +
                        " artifacts (" + capability + ")";
      Logger::getInstance().log(LogLevel::ERROR, s.result.name + ": " + msg);
      finish(s, ArtifactOutcome::Error, msg);
    }
  }

  void chunkAll() {
    Chunker chunker(config_.chunkSize);
    boost::asio::thread_pool pool(config_.hashConcurrency);
    for (auto &s : slots_) {
      if (!active(s))
        continue;
      Slot *slot = &s;
      // Each task writes only its own slot.
      boost::asio::post(pool, [this, slot, &chunker] {
        if (token_.isCancelled())
          return;
        try {
          slot->chunked = chunker.chunk(slot->result.id, *slot->artifact);
        } catch (const UploadException &e) {
          slot->result.outcome = ArtifactOutcome::IoError;
          slot->result.detail = e.what();
        }
      });
    }
    pool.join();

    for (auto &s : slots_) {
      if (!active(s) || s.chunked)
        continue;
      if (s.result.outcome == ArtifactOutcome::IoError) {
        std::string detail = s.result.detail;
        finish(s, ArtifactOutcome::IoError, detail);
      }
      // Unchunked slots left active were skipped by cancellation.
    }
  }

  void buildManifests() {
    for (auto &s : slots_) {
      if (!active(s) || !s.chunked)
        continue;
      s.result.checksum = s.chunked->checksum;
      try {
        s.manifest = AssembleCoordinator::buildManifest(*s.artifact, *s.chunked);
      } catch (const UploadException &e) {
        finish(s, outcomeForError(e.kind()), e.what());
      }
    }
  }

  void indexChunks() {
    for (auto &s : slots_) {
      if (!active(s) || !s.manifest)
        continue;
      stats_.referenced += s.chunked->chunks.size();
      index_.insertArtifact(*s.chunked);
    }
    stats_.total = index_.size();
  }

  std::vector<Digest> planUploads() {
    if (!config_.dedup)
      return index_.checksums();

    std::vector<Digest> artifactSums;
    std::set<Digest> seenArtifacts;
    for (const auto &s : slots_) {
      if (active(s) && s.manifest &&
          seenArtifacts.insert(s.manifest->artifactChecksum).second)
        artifactSums.push_back(s.manifest->artifactChecksum);
    }
    std::vector<Digest> missingArtifacts = diff_.missingArtifacts(artifactSums);
    std::set<Digest> unknown(missingArtifacts.begin(), missingArtifacts.end());

    // Chunks of artifacts the server already has are never diffed.
    std::vector<Digest> candidates;
    std::set<Digest> seen;
    for (const auto &s : slots_) {
      if (!active(s) || !s.manifest ||
          unknown.count(s.manifest->artifactChecksum) == 0)
        continue;
      for (const auto &d : s.manifest->chunks) {
        if (seen.insert(d).second)
          candidates.push_back(d);
      }
    }
    std::vector<Digest> missing = diff_.missingChunks(candidates);
    std::set<Digest> missingSet(missing.begin(), missing.end());

    for (const auto &d : index_.checksums()) {
      if (missingSet.count(d))
        continue;
      index_.markPresent(d);
      ++stats_.deduplicated;
      MetricsRegistry::instance().incrementCounter(
          "chunkup_chunks_deduplicated_total");
      ProgressEvent ev;
      ev.type = ProgressEvent::Type::ChunkSkipped;
      ev.chunk = d;
      emit(ev);
    }
    return missing;
  }

  void absorb(const UploadReport &report) {
    stats_.uploaded += report.uploaded;
    stats_.bytesUploaded += report.bytesUploaded;
    stats_.failed += report.failedChunks.size();
    for (const auto &kv : report.failedArtifacts) {
      if (kv.first < slots_.size())
        finish(slots_[kv.first], ArtifactOutcome::ChunkUploadFailed,
               kv.second);
    }
  }

  void uploadMissing() {
    std::vector<Digest> missing;
    try {
      missing = planUploads();
    } catch (const UploadException &e) {
      if (e.kind() != ErrorKind::Cancelled)
        throw;
      return;
    }
    absorb(scheduler_.run(missing));
  }

  // Second chance for artifacts whose assembly the server lost.
  void restart(const std::vector<Slot *> &lost,
               const std::map<Digest, wire::AssembleEntryResponse> &responses) {
    std::vector<Digest> redo;
    std::vector<Digest> rediff;
    std::set<Digest> seen;
    for (Slot *s : lost) {
      s->restarted = true;
      Logger::getInstance().log(LogLevel::WARN,
                                "Server lost assembly of " + s->result.name +
                                    ", re-uploading its chunks once");
      auto it = responses.find(s->manifest->artifactChecksum);
      bool serverListed =
          it != responses.end() && !it->second.missingChunks.empty();
      const auto &source = serverListed ? it->second.missingChunks
                                        : s->manifest->chunks;
      std::set<Digest> own(s->manifest->chunks.begin(),
                           s->manifest->chunks.end());
      for (const auto &d : source) {
        if (own.count(d) == 0 || !seen.insert(d).second)
          continue;
        (serverListed ? redo : rediff).push_back(d);
      }
    }

    if (!rediff.empty()) {
      if (config_.dedup) {
        try {
          rediff = diff_.missingChunks(rediff);
        } catch (const UploadException &e) {
          if (e.kind() != ErrorKind::Cancelled)
            throw;
          return;
        }
      }
      redo.insert(redo.end(), rediff.begin(), rediff.end());
    }
    for (const auto &d : redo)
      index_.markMissing(d);
    absorb(scheduler_.run(redo));
  }

  /// Submit every unfinished manifest once and apply the answers.
  StepResult<bool> assembleStep() {
    std::vector<AssemblyManifest> manifests;
    for (const auto &s : slots_) {
      if (active(s) && s.manifest)
        manifests.push_back(*s.manifest);
    }
    restartedLastStep_ = false;
    if (manifests.empty())
      return {PollState::Done, true};

    AssembleRound round = coordinator_.submit(manifests);
    std::vector<Slot *> lost;
    std::set<Digest> lostSums;
    for (auto &s : slots_) {
      if (!active(s) || !s.manifest)
        continue;
      const Digest &key = s.manifest->artifactChecksum;
      auto failure = round.failures.find(key);
      if (failure != round.failures.end()) {
        finish(s, outcomeForError(failure->second.kind),
               failure->second.detail);
        continue;
      }
      auto it = round.responses.find(key);
      if (it == round.responses.end()) {
        finish(s, ArtifactOutcome::ProtocolError, "no assemble state");
        continue;
      }
      const wire::AssembleEntryResponse &resp = it->second;
      setStatus(s, resp.state);
      bool lostAssembly =
          resp.state == AssemblyStatus::NotFound ||
          (!IsTerminal(resp.state) && !resp.missingChunks.empty());
      if (resp.state == AssemblyStatus::Ok) {
        finish(s, ArtifactOutcome::Ok, resp.detail);
      } else if (resp.state == AssemblyStatus::Error) {
        std::string detail =
            resp.detail.empty() ? "assembly failed" : resp.detail;
        Logger::getInstance().log(LogLevel::ERROR,
                                  s.result.name + ": " + detail);
        finish(s, ArtifactOutcome::Error, detail);
      } else if (lostAssembly) {
        if (s.restarted) {
          Logger::getInstance().log(LogLevel::ERROR, "Server lost assembly of " +
                                                         s.result.name +
                                                         " again");
          finish(s, ArtifactOutcome::NotFound,
                 "assembly lost twice by the server");
        } else if (lostSums.insert(key).second) {
          lost.push_back(&s);
        } else {
          // Shares the restart of an identical artifact.
          s.restarted = true;
        }
      }
    }

    if (!lost.empty()) {
      restart(lost, round.responses);
      restartedLastStep_ = true;
    }

    for (const auto &s : slots_) {
      if (active(s) && s.manifest)
        return {PollState::Pending, false};
    }
    return {PollState::Done, true};
  }

  void assemble() {
    switch (config_.wait.mode) {
    case WaitMode::FireAndForget: {
      // A restart re-uploads chunks, so the manifest is submitted once more.
      StepResult<bool> r = assembleStep();
      if (r.state == PollState::Pending && restartedLastStep_ &&
          !token_.isCancelled())
        assembleStep();
      pendingDetail_ = "accepted for processing";
      break;
    }
    case WaitMode::Blocking:
    case WaitMode::BoundedWait: {
      PollPolicy policy = config_.poll;
      auto limit = config_.wait.mode == WaitMode::Blocking
                       ? config_.wait.globalTimeout
                       : config_.wait.waitFor;
      policy.deadline =
          std::chrono::duration_cast<std::chrono::milliseconds>(limit);
      auto result =
          pollUntil([this] { return assembleStep(); }, policy, token_);
      if (result.timedOut) {
        pendingDetail_ = "still processing after " +
                         std::to_string(limit.count()) + "s";
        Logger::getInstance().log(LogLevel::WARN,
                                  "Stopped waiting for assembly: " +
                                      pendingDetail_);
      }
      break;
    }
    }
  }

  void settleRemaining() {
    bool cancelled = token_.isCancelled();
    for (auto &s : slots_) {
      if (s.done)
        continue;
      if (cancelled) {
        finish(s, ArtifactOutcome::Cancelled, "cancelled");
      } else {
        finish(s, ArtifactOutcome::Pending, pendingDetail_);
      }
    }
  }

  const UploadConfig &config_;
  const CancellationToken &token_;
  const ProgressSink &progress_;
  const std::vector<Artifact> &artifacts_;
  ChunkIndex index_;
  DiffQuery diff_;
  UploadScheduler scheduler_;
  AssembleCoordinator coordinator_;
  std::vector<Slot> slots_;
  ChunkStats stats_;
  bool restartedLastStep_{false};
  std::string pendingDetail_;
};

} // namespace

Uploader::Uploader(http::Transport &transport, UploadConfig config,
                   CancellationToken token, ProgressSink progress)
    : transport_(transport), config_(std::move(config)),
      token_(std::move(token)), progress_(std::move(progress)) {
  validateUploadConfig(config_);
}

void Uploader::configureFromServer() {
  wire::ChunkServerOptions options =
      fetchServerOptions(transport_, config_.endpoints.options);
  applyServerOptions(config_, options);
  validateUploadConfig(config_);
  Logger::getInstance().log(
      LogLevel::DEBUG, "Server chunk size " + std::to_string(config_.chunkSize) +
                           ", concurrency " +
                           std::to_string(config_.concurrency) +
                           ", compression " +
                           ChunkCompressionToString(config_.compression));
}

BatchResult Uploader::uploadAndAssemble(const std::vector<Artifact> &artifacts) {
  BatchRun batch(transport_, config_, token_, progress_, artifacts);
  return batch.run();
}

} // namespace chunkup
