#ifndef CHUNKUP_DIFF_QUERY_HPP
#define CHUNKUP_DIFF_QUERY_HPP

#include "chunkup/transport/http.hpp"
#include "chunkup/utilities/backoff.hpp"
#include "chunkup/utilities/cancellation.hpp"
#include "chunkup/utilities/digest.hpp"

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace chunkup {

struct DiffOptions {
  std::string chunkPath;
  std::string artifactPath;
  size_t pageSize{1000};
  RetryPolicy retry;
};

/**
 * @brief Asks the server which checksums it does not hold yet.
 *
 * Checksum lists are split into pages of at most pageSize entries. A page
 * whose request fails for any reason is reported as entirely missing, so a
 * broken diff costs bandwidth but never skips a required upload.
 */
class DiffQuery {
public:
  DiffQuery(http::Transport &transport, DiffOptions options,
            CancellationToken token = {});

  /// Subset of @p checksums the server reports as missing chunks.
  std::vector<Digest> missingChunks(const std::vector<Digest> &checksums);

  /// Subset of whole-artifact checksums the server does not know.
  std::vector<Digest> missingArtifacts(const std::vector<Digest> &checksums);

  /// Pages that were answered conservatively since construction.
  size_t degradedPages() const { return degraded_.load(); }

private:
  std::vector<Digest> missing(const std::string &path,
                              const std::vector<Digest> &checksums);
  std::optional<std::vector<Digest>> queryPage(const std::string &path,
                                               const std::vector<Digest> &page);

  http::Transport &transport_;
  DiffOptions options_;
  CancellationToken token_;
  std::atomic<size_t> degraded_{0};
};

} // namespace chunkup

#endif // CHUNKUP_DIFF_QUERY_HPP
