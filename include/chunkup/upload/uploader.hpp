#ifndef CHUNKUP_UPLOADER_HPP
#define CHUNKUP_UPLOADER_HPP

#include "chunkup/transport/http.hpp"
#include "chunkup/upload/result.hpp"
#include "chunkup/upload/types.hpp"
#include "chunkup/upload/upload_config.hpp"
#include "chunkup/utilities/cancellation.hpp"

#include <vector>

namespace chunkup {

/**
 * @brief Entry point of the upload engine.
 *
 * Runs size checks, chunking, dedup against the server, chunk uploads and
 * assembly for a closed list of artifacts. Per-artifact failures become
 * outcomes in the returned BatchResult; the call itself only throws for
 * programming errors. No console output is produced; progress is reported
 * through the optional sink.
 */
class Uploader {
public:
  /// @throw UploadException (Config) if @p config fails validation.
  Uploader(http::Transport &transport, UploadConfig config,
           CancellationToken token = {}, ProgressSink progress = {});

  /**
   * @brief Fetch the server's chunk-upload options and merge them into the
   * configuration.
   * @throw UploadException on transport or protocol failures.
   */
  void configureFromServer();

  BatchResult uploadAndAssemble(const std::vector<Artifact> &artifacts);

  const UploadConfig &config() const { return config_; }

private:
  http::Transport &transport_;
  UploadConfig config_;
  CancellationToken token_;
  ProgressSink progress_;
};

} // namespace chunkup

#endif // CHUNKUP_UPLOADER_HPP
