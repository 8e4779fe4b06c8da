#include "chunkup/upload/diff_query.hpp"
#include "chunkup/upload/errors.hpp"
#include "chunkup/upload/retry.hpp"
#include "chunkup/upload/wire.hpp"
#include "chunkup/utilities/logger.h"
#include "chunkup/utilities/metrics.h"

#include <algorithm>
#include <set>
#include <utility>

namespace chunkup {

DiffQuery::DiffQuery(http::Transport &transport, DiffOptions options,
                     CancellationToken token)
    : transport_(transport), options_(std::move(options)),
      token_(std::move(token)) {
  if (options_.pageSize == 0)
    options_.pageSize = 1;
}

std::vector<Digest>
DiffQuery::missingChunks(const std::vector<Digest> &checksums) {
  return missing(options_.chunkPath, checksums);
}

std::vector<Digest>
DiffQuery::missingArtifacts(const std::vector<Digest> &checksums) {
  return missing(options_.artifactPath, checksums);
}

std::vector<Digest> DiffQuery::missing(const std::string &path,
                                       const std::vector<Digest> &checksums) {
  std::vector<Digest> out;
  for (size_t start = 0; start < checksums.size();
       start += options_.pageSize) {
    size_t end = std::min(checksums.size(), start + options_.pageSize);
    std::vector<Digest> page(checksums.begin() + start,
                             checksums.begin() + end);
    auto answer = queryPage(path, page);
    if (!answer) {
      ++degraded_;
      MetricsRegistry::instance().incrementCounter(
          "chunkup_diff_degraded_total");
      out.insert(out.end(), page.begin(), page.end());
      continue;
    }
    // Only report checksums we actually asked about.
    std::set<Digest> asked(page.begin(), page.end());
    for (const auto &d : *answer) {
      if (asked.erase(d) > 0)
        out.push_back(d);
    }
  }
  return out;
}

std::optional<std::vector<Digest>>
DiffQuery::queryPage(const std::string &path, const std::vector<Digest> &page) {
  http::Request req;
  req.method = http::HttpMethod::POST;
  req.path = path;
  req.headers["Content-Type"] = "application/json";
  req.body = wire::encodeChecksumList(page);

  std::string reason;
  try {
    RetryOutcome r = sendWithRetry(transport_, req, options_.retry, token_,
                                   http::IsTransientStatus);
    if (r.response.isSuccess())
      return wire::decodeMissingList(r.response.body);
    reason = "HTTP " + std::to_string(r.response.status) + " " +
             http::ReasonPhrase(r.response.status);
  } catch (const http::TransportError &e) {
    reason = e.what();
  } catch (const UploadException &e) {
    // A cancelled query must not turn into a full upload.
    if (e.kind() == ErrorKind::Cancelled)
      throw;
    reason = e.what();
  }
  Logger::getInstance().log(LogLevel::WARN,
                            "Diff request to " + path + " failed (" + reason +
                                "), treating " + std::to_string(page.size()) +
                                " checksums as missing");
  return std::nullopt;
}

} // namespace chunkup
