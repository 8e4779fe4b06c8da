#ifndef CHUNKUP_CANCELLATION_HPP
#define CHUNKUP_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace chunkup {

/**
 * @brief Shared, copyable cancellation flag.
 *
 * All copies observe the same state. Waiting through waitFor() wakes up as
 * soon as cancel() is called from any thread.
 */
class CancellationToken {
public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  void cancel() {
    {
      std::lock_guard<std::mutex> lk(state_->mutex);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

  bool isCancelled() const { return state_->cancelled.load(); }

  /**
   * @brief Sleep for @p duration unless cancelled first.
   * @return true if the token was cancelled.
   */
  template <typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> duration) const {
    std::unique_lock<std::mutex> lk(state_->mutex);
    return state_->cv.wait_for(lk, duration,
                               [this] { return state_->cancelled.load(); });
  }

private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    std::atomic<bool> cancelled{false};
  };
  std::shared_ptr<State> state_;
};

} // namespace chunkup

#endif // CHUNKUP_CANCELLATION_HPP
