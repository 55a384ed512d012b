#include <gtest/gtest.h>
#include "engine/resilience/circuit_breaker.hpp"
#include "engine/resilience/retry_executor.hpp"
#include "manual_scheduler.hpp"

#include <future>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace quell::resilience;
using quell::test::ManualScheduler;

namespace {

std::future<int> Ready(int value) {
  std::promise<int> promise;
  promise.set_value(value);
  return promise.get_future();
}

std::future<int> Failed(const std::string& message) {
  std::promise<int> promise;
  promise.set_exception(std::make_exception_ptr(std::runtime_error(message)));
  return promise.get_future();
}

}  // namespace

class RetryExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    CircuitBreakerOptions breaker_options;
    breaker_options.failure_threshold = 5;
    breaker_options.open_timeout = std::chrono::milliseconds(60000);
    breaker_ = std::make_unique<CircuitBreaker>(breaker_options, scheduler_.AsTimeSource());
  }

  std::unique_ptr<RetryExecutor> MakeExecutor(RetryPolicy policy = RetryPolicy(),
                                              OperationTimeouts timeouts = OperationTimeouts()) {
    return std::make_unique<RetryExecutor>(
        *breaker_, policy, timeouts,
        [this](std::chrono::milliseconds delay) { sleeps_.push_back(delay); });
  }

  ManualScheduler scheduler_;
  std::unique_ptr<CircuitBreaker> breaker_;
  std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(RetryExecutorTest, FirstAttemptSuccess) {
  auto executor = MakeExecutor();
  int calls = 0;
  RetryExecutor::Outcome outcome;

  auto result = executor->Execute<int>([&]() { ++calls; return Ready(42); },
                                       OperationKind::GET, std::nullopt, &outcome);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 42);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(outcome, RetryExecutor::Outcome::SUCCESS);
  EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RetryExecutorTest, RetriesWithBackoffThenSucceeds) {
  RetryPolicy policy;
  policy.jitter = 0.0;
  auto executor = MakeExecutor(policy);
  int calls = 0;

  auto result = executor->Execute<int>([&]() {
    ++calls;
    return calls < 3 ? Failed("transient") : Ready(7);
  }, OperationKind::SET);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 7);
  EXPECT_EQ(calls, 3);
  ASSERT_EQ(sleeps_.size(), 2u);
  EXPECT_EQ(sleeps_[0], std::chrono::milliseconds(500));
  EXPECT_EQ(sleeps_[1], std::chrono::milliseconds(1000));
  EXPECT_EQ(breaker_->GetStatus().failure_count, 0);
}

TEST_F(RetryExecutorTest, ExhaustionRecordsOneFailure) {
  auto executor = MakeExecutor();
  int calls = 0;
  RetryExecutor::Outcome outcome;

  auto result = executor->Execute<int>([&]() { ++calls; return Failed("down"); },
                                       OperationKind::GET, std::nullopt, &outcome);

  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(outcome, RetryExecutor::Outcome::EXHAUSTED);
  EXPECT_EQ(sleeps_.size(), 2u);
  EXPECT_EQ(breaker_->GetStatus().failure_count, 1);
}

TEST_F(RetryExecutorTest, OpenCircuitSkipsOperation) {
  RetryPolicy policy;
  policy.max_attempts = 1;
  auto executor = MakeExecutor(policy);

  for (int i = 0; i < 5; ++i) {
    executor->Execute<int>([]() { return Failed("down"); }, OperationKind::GET);
  }
  ASSERT_EQ(breaker_->GetState(), CircuitState::OPEN);

  bool invoked = false;
  RetryExecutor::Outcome outcome;
  auto result = executor->Execute<int>([&]() { invoked = true; return Ready(1); },
                                       OperationKind::GET, std::nullopt, &outcome);

  EXPECT_FALSE(result.has_value());
  EXPECT_FALSE(invoked);
  EXPECT_EQ(outcome, RetryExecutor::Outcome::CIRCUIT_OPEN);
}

TEST_F(RetryExecutorTest, HalfOpenProbeSuccessCountsTowardsRecovery) {
  RetryPolicy policy;
  policy.max_attempts = 1;
  auto executor = MakeExecutor(policy);
  for (int i = 0; i < 5; ++i) {
    executor->Execute<int>([]() { return Failed("down"); }, OperationKind::GET);
  }
  scheduler_.AdvanceBy(std::chrono::milliseconds(60001));

  for (int i = 0; i < 3; ++i) {
    auto result = executor->Execute<int>([]() { return Ready(1); }, OperationKind::GET);
    EXPECT_TRUE(result.has_value());
  }
  EXPECT_EQ(breaker_->GetState(), CircuitState::CLOSED);
}

TEST_F(RetryExecutorTest, UnsatisfiedFutureTimesOut) {
  RetryPolicy policy;
  policy.max_attempts = 2;
  OperationTimeouts timeouts;
  timeouts.command = std::chrono::milliseconds(20);
  auto executor = MakeExecutor(policy, timeouts);

  std::vector<std::unique_ptr<std::promise<int>>> parked;
  RetryExecutor::Outcome outcome;
  auto result = executor->Execute<int>([&]() {
    parked.push_back(std::make_unique<std::promise<int>>());
    return parked.back()->get_future();
  }, OperationKind::GET, std::nullopt, &outcome);

  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(parked.size(), 2u);
  EXPECT_EQ(outcome, RetryExecutor::Outcome::EXHAUSTED);
}

TEST_F(RetryExecutorTest, TimeoutOverrideWins) {
  OperationTimeouts timeouts;
  auto executor = MakeExecutor(RetryPolicy(), timeouts);
  EXPECT_EQ(executor->GetTimeout(OperationKind::GET), std::chrono::milliseconds(4000));
  EXPECT_EQ(executor->GetTimeout(OperationKind::BATCH), std::chrono::milliseconds(10000));
  EXPECT_EQ(executor->GetTimeout(OperationKind::CRITICAL), std::chrono::milliseconds(6000));
  EXPECT_EQ(executor->GetTimeout(OperationKind::HEALTH_CHECK), std::chrono::milliseconds(5000));

  RetryPolicy policy;
  policy.max_attempts = 1;
  auto quick = MakeExecutor(policy, timeouts);
  std::promise<int> never;
  auto result = quick->Execute<int>([&]() { return never.get_future(); }, OperationKind::GET,
                                    std::chrono::milliseconds(10));
  EXPECT_FALSE(result.has_value());
}

TEST_F(RetryExecutorTest, BackoffStaysWithinJitterBounds) {
  RetryPolicy policy;
  policy.base_delay = std::chrono::milliseconds(500);
  policy.max_delay = std::chrono::milliseconds(2000);
  policy.jitter = 0.25;
  auto executor = MakeExecutor(policy);

  for (int i = 0; i < 50; ++i) {
    auto first = executor->ComputeBackoff(1);
    EXPECT_GE(first, std::chrono::milliseconds(500));
    EXPECT_LE(first, std::chrono::milliseconds(625));

    auto capped = executor->ComputeBackoff(6);
    EXPECT_GE(capped, std::chrono::milliseconds(1500));
    EXPECT_LE(capped, std::chrono::milliseconds(2500));
  }
}

TEST_F(RetryExecutorTest, RejectsInvalidPolicy) {
  RetryPolicy policy;
  policy.max_attempts = 0;
  EXPECT_THROW(RetryExecutor executor(*breaker_, policy), std::invalid_argument);

  policy.max_attempts = 1;
  policy.multiplier = 0.9;
  EXPECT_THROW(RetryExecutor executor(*breaker_, policy), std::invalid_argument);

  policy.multiplier = 2.0;
  policy.jitter = 1.5;
  EXPECT_THROW(RetryExecutor executor(*breaker_, policy), std::invalid_argument);
}
