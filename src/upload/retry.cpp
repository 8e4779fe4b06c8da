#include "chunkup/upload/retry.hpp"
#include "chunkup/upload/errors.hpp"
#include "chunkup/utilities/logger.h"

#include <algorithm>

namespace chunkup {

RetryOutcome sendWithRetry(http::Transport &transport,
                           const http::Request &request,
                           const RetryPolicy &policy,
                           const CancellationToken &token,
                           const RetryableStatus &retryable) {
  ExponentialBackoff backoff(policy);
  const unsigned maxAttempts = std::max(1u, policy.maxAttempts);
  RetryOutcome outcome;

  while (true) {
    if (token.isCancelled()) {
      ThrowUploadException(ErrorKind::Cancelled,
                           "Cancelled before " +
                               http::DescribeRequest(request));
    }
    ++outcome.attempts;
    std::string failure;
    try {
      outcome.response = transport.send(request);
      if (!retryable || !retryable(outcome.response.status))
        return outcome;
      failure = "HTTP " + std::to_string(outcome.response.status) + " " +
                http::ReasonPhrase(outcome.response.status);
      if (outcome.attempts >= maxAttempts)
        return outcome;
    } catch (const http::TransportError &e) {
      if (!e.isTransient() || outcome.attempts >= maxAttempts)
        throw;
      failure = e.what();
    }

    auto delay = backoff.next();
    Logger::getInstance().log(
        LogLevel::WARN, http::DescribeRequest(request) + " failed (" +
                            failure + "), retrying in " +
                            std::to_string(delay.count()) + "ms (attempt " +
                            std::to_string(outcome.attempts + 1) + "/" +
                            std::to_string(maxAttempts) + ")");
    if (token.waitFor(delay)) {
      ThrowUploadException(ErrorKind::Cancelled,
                           "Cancelled while retrying " +
                               http::DescribeRequest(request));
    }
  }
}

} // namespace chunkup
