#ifndef CHUNKUP_POLL_LOOP_HPP
#define CHUNKUP_POLL_LOOP_HPP

#include "chunkup/utilities/cancellation.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <type_traits>
#include <utility>

namespace chunkup {

/// How long the caller is prepared to wait for server-side processing.
enum class WaitMode { Blocking, BoundedWait, FireAndForget };

struct WaitPolicy {
  WaitMode mode{WaitMode::FireAndForget};
  /// Ceiling for BoundedWait.
  std::chrono::seconds waitFor{0};
  /// Safety net for Blocking.
  std::chrono::seconds globalTimeout{3600};
  /// Treat artifacts still pending at the deadline as failures.
  bool strict{false};
};

struct PollPolicy {
  std::chrono::milliseconds interval{1000};
  double backoffFactor{1.0};
  std::chrono::milliseconds maxInterval{5000};
  /// Measured from the first step. Unset means no deadline.
  std::optional<std::chrono::milliseconds> deadline;
};

enum class PollState { Pending, Done, Failed };

template <typename T> struct StepResult {
  PollState state{PollState::Pending};
  T value{};
};

template <typename T> struct PollResult {
  PollState state{PollState::Pending};
  T value{};
  unsigned attempts{0};
  bool timedOut{false};
  bool cancelled{false};
};

/**
 * @brief Call @p step until it reports Done or Failed, the deadline passes
 * or @p token is cancelled.
 *
 * @p step must return a StepResult<T>. The first call happens immediately;
 * later calls are spaced by the policy's interval, multiplied by
 * backoffFactor after every pending answer and capped at maxInterval.
 * A timed out or cancelled loop returns Pending with the last value.
 */
template <typename Step>
auto pollUntil(Step &&step, const PollPolicy &policy,
               const CancellationToken &token)
    -> PollResult<decltype(step().value)> {
  using Value = decltype(step().value);
  using Clock = std::chrono::steady_clock;

  PollResult<Value> result;
  const auto start = Clock::now();
  auto interval = policy.interval;

  while (true) {
    if (token.isCancelled()) {
      result.cancelled = true;
      return result;
    }
    StepResult<Value> r = step();
    ++result.attempts;
    result.state = r.state;
    result.value = std::move(r.value);
    if (result.state != PollState::Pending)
      return result;

    auto wait = interval;
    if (policy.deadline) {
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          Clock::now() - start);
      if (elapsed >= *policy.deadline) {
        result.timedOut = true;
        return result;
      }
      wait = std::min(wait, *policy.deadline - elapsed);
    }
    if (token.waitFor(wait)) {
      result.cancelled = true;
      return result;
    }

    auto next = std::chrono::milliseconds(static_cast<long long>(
        static_cast<double>(interval.count()) * policy.backoffFactor));
    interval = std::min(std::max(next, interval), policy.maxInterval);
  }
}

} // namespace chunkup

#endif // CHUNKUP_POLL_LOOP_HPP
