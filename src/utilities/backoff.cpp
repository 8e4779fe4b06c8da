#include "chunkup/utilities/backoff.hpp"

#include <algorithm>
#include <cstdint>
#include <sodium.h>
#include <stdexcept>

namespace chunkup {

ExponentialBackoff::ExponentialBackoff(const RetryPolicy &policy)
    : policy_(policy),
      current_ms_(static_cast<double>(policy.initialDelay.count())) {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

std::chrono::milliseconds ExponentialBackoff::next() {
  const double cap = static_cast<double>(policy_.maxDelay.count());
  const auto base = static_cast<uint32_t>(std::min(current_ms_, cap));
  current_ms_ = std::min(current_ms_ * policy_.multiplier, cap);
  ++steps_;

  if (!policy_.jitter || base < 2) {
    return std::chrono::milliseconds(base);
  }
  const uint32_t half = base / 2;
  return std::chrono::milliseconds(half +
                                   randombytes_uniform(base - half + 1));
}

void ExponentialBackoff::reset() {
  current_ms_ = static_cast<double>(policy_.initialDelay.count());
  steps_ = 0;
}

} // namespace chunkup
