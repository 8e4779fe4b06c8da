#ifndef CHUNKUP_ASSEMBLE_HPP
#define CHUNKUP_ASSEMBLE_HPP

#include "chunkup/transport/http.hpp"
#include "chunkup/upload/errors.hpp"
#include "chunkup/upload/types.hpp"
#include "chunkup/upload/wire.hpp"
#include "chunkup/utilities/backoff.hpp"
#include "chunkup/utilities/cancellation.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace chunkup {

struct AssembleOptions {
  std::string path;
  /// Manifests per request; 1 sends one request per artifact.
  size_t batchSize{1};
  RetryPolicy retry;
};

struct AssembleFailure {
  ErrorKind kind{ErrorKind::Protocol};
  std::string detail;
};

/// Outcome of one submit() call, keyed by artifact checksum.
struct AssembleRound {
  std::map<Digest, wire::AssembleEntryResponse> responses;
  std::map<Digest, AssembleFailure> failures;
};

/**
 * @brief Builds assembly manifests and submits them to the server.
 *
 * The same request doubles as the status poll: resubmitting a manifest
 * returns the current state of its assembly.
 */
class AssembleCoordinator {
public:
  AssembleCoordinator(http::Transport &transport, AssembleOptions options,
                      CancellationToken token = {});

  /**
   * @brief Manifest for a chunked artifact.
   * @throw UploadException (ChecksumMismatch) if the artifact carries a
   *        checksum that differs from the recomputed one.
   */
  static AssemblyManifest buildManifest(const Artifact &artifact,
                                        const ChunkedArtifact &chunked);

  /**
   * @brief Submit @p manifests in batches.
   *
   * Every distinct artifact checksum ends up either in the responses or in
   * the failures of the returned round. Gateway errors are retried; other
   * non-2xx statuses, unexpected checksums and malformed bodies fail every
   * artifact of the affected request.
   */
  AssembleRound submit(const std::vector<AssemblyManifest> &manifests);

  /// HTTP requests issued since construction.
  size_t requestsSent() const { return requests_.load(); }

private:
  void submitBatch(const std::vector<AssemblyManifest> &batch,
                   AssembleRound &round);

  http::Transport &transport_;
  AssembleOptions options_;
  CancellationToken token_;
  std::atomic<size_t> requests_{0};
};

} // namespace chunkup

#endif // CHUNKUP_ASSEMBLE_HPP
