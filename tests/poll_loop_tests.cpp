#include "chunkup/upload/poll_loop.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace chunkup;
using namespace std::chrono_literals;

TEST(PollLoopTest, StopsOnFirstTerminalAnswer) {
  PollPolicy policy;
  policy.interval = 1ms;
  int calls = 0;
  auto result = pollUntil(
      [&] {
        ++calls;
        return StepResult<int>{calls < 4 ? PollState::Pending : PollState::Done,
                               calls};
      },
      policy, CancellationToken{});
  EXPECT_EQ(result.state, PollState::Done);
  EXPECT_EQ(result.attempts, 4u);
  EXPECT_EQ(result.value, 4);
  EXPECT_EQ(calls, 4);
  EXPECT_FALSE(result.timedOut);
}

TEST(PollLoopTest, ImmediateAnswerNeedsOneAttempt) {
  PollPolicy policy;
  policy.interval = 10s;
  auto start = std::chrono::steady_clock::now();
  auto result = pollUntil([] { return StepResult<int>{PollState::Failed, 7}; },
                          policy, CancellationToken{});
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
  EXPECT_EQ(result.state, PollState::Failed);
  EXPECT_EQ(result.attempts, 1u);
  EXPECT_EQ(result.value, 7);
}

TEST(PollLoopTest, DeadlineEndsWithPending) {
  PollPolicy policy;
  policy.interval = 5ms;
  policy.deadline = 30ms;
  auto result = pollUntil([] { return StepResult<int>{PollState::Pending, 1}; },
                          policy, CancellationToken{});
  EXPECT_EQ(result.state, PollState::Pending);
  EXPECT_TRUE(result.timedOut);
  EXPECT_FALSE(result.cancelled);
  EXPECT_GE(result.attempts, 2u);
}

TEST(PollLoopTest, IntervalGrowsUpToCap) {
  PollPolicy policy;
  policy.interval = 1ms;
  policy.backoffFactor = 2.0;
  policy.maxInterval = 4ms;
  std::vector<std::chrono::steady_clock::time_point> stamps;
  pollUntil(
      [&] {
        stamps.push_back(std::chrono::steady_clock::now());
        return StepResult<int>{
            stamps.size() < 6 ? PollState::Pending : PollState::Done, 0};
      },
      policy, CancellationToken{});
  ASSERT_EQ(stamps.size(), 6u);
  // 1 + 2 + 4 + 4 + 4 ms of waiting at least.
  EXPECT_GE(stamps.back() - stamps.front(), 15ms);
}

TEST(PollLoopTest, CancelledBeforeStart) {
  CancellationToken token;
  token.cancel();
  int calls = 0;
  auto result = pollUntil(
      [&] {
        ++calls;
        return StepResult<int>{PollState::Done, 0};
      },
      PollPolicy{}, token);
  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(result.attempts, 0u);
  EXPECT_EQ(calls, 0);
}

TEST(PollLoopTest, CancelWakesSleepingLoop) {
  PollPolicy policy;
  policy.interval = 60s;
  CancellationToken token;
  std::thread canceller([token]() mutable {
    std::this_thread::sleep_for(20ms);
    token.cancel();
  });
  auto start = std::chrono::steady_clock::now();
  auto result = pollUntil([] { return StepResult<int>{PollState::Pending, 0}; },
                          policy, token);
  canceller.join();
  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(result.state, PollState::Pending);
  EXPECT_EQ(result.attempts, 1u);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
}
