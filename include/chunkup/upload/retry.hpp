#ifndef CHUNKUP_RETRY_HPP
#define CHUNKUP_RETRY_HPP

#include "chunkup/transport/http.hpp"
#include "chunkup/utilities/backoff.hpp"
#include "chunkup/utilities/cancellation.hpp"

#include <functional>
#include <string>

namespace chunkup {

struct RetryOutcome {
  http::Response response;
  unsigned attempts{0};
};

/// Decides whether a status is worth another attempt.
using RetryableStatus = std::function<bool(int)>;

/**
 * @brief Send @p request, repeating it on transient failures.
 *
 * A response whose status satisfies @p retryable, or a transient
 * http::TransportError, triggers another attempt after a backoff delay
 * until @p policy.maxAttempts attempts have been made. The last response is
 * returned as is; the last transport error is rethrown.
 *
 * @throw UploadException (Cancelled) if @p token fires while waiting.
 * @throw http::TransportError on non-transient or exhausted transport
 *        failures.
 */
RetryOutcome sendWithRetry(http::Transport &transport,
                           const http::Request &request,
                           const RetryPolicy &policy,
                           const CancellationToken &token,
                           const RetryableStatus &retryable);

} // namespace chunkup

#endif // CHUNKUP_RETRY_HPP
