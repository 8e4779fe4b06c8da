#ifndef CHUNKUP_BACKOFF_HPP
#define CHUNKUP_BACKOFF_HPP

#include <chrono>

namespace chunkup {

/**
 * @brief Retry/backoff policy for transient request failures.
 *
 * @c maxAttempts counts every attempt including the first one.
 */
struct RetryPolicy {
  unsigned maxAttempts{5};
  std::chrono::milliseconds initialDelay{1000};
  double multiplier{1.5};
  std::chrono::milliseconds maxDelay{5000};
  bool jitter{true};
};

/**
 * @brief Exponential backoff with optional "equal jitter".
 *
 * The n-th delay is initialDelay * multiplier^n capped at maxDelay. With
 * jitter enabled the returned delay is uniformly drawn from
 * [delay/2, delay] using libsodium's CSPRNG.
 */
class ExponentialBackoff {
public:
  explicit ExponentialBackoff(const RetryPolicy &policy);

  /** Delay to wait before the next attempt. Advances the sequence. */
  std::chrono::milliseconds next();

  /** Restart the sequence from the initial delay. */
  void reset();

  /** Number of delays handed out since construction or reset(). */
  unsigned steps() const { return steps_; }

private:
  RetryPolicy policy_;
  double current_ms_;
  unsigned steps_{0};
};

} // namespace chunkup

#endif // CHUNKUP_BACKOFF_HPP
