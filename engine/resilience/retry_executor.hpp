#pragma once

#include "engine/resilience/circuit_breaker.hpp"
#include <spdlog/spdlog.h>

#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>

namespace quell {
namespace resilience {

// Operation classes with their own timeouts
enum class OperationKind {
  GET,
  SET,
  DEL,
  BATCH,
  CRITICAL,
  HEALTH_CHECK
};

const char* ToString(OperationKind kind);

struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds base_delay{500};
  double multiplier = 2.0;
  std::chrono::milliseconds max_delay{2000};
  double jitter = 0.25;  // +/- fraction of the computed delay
};

struct OperationTimeouts {
  std::chrono::milliseconds command{4000};  // GET, SET, DEL
  std::chrono::milliseconds batch{10000};
  std::chrono::milliseconds critical{6000};
  std::chrono::milliseconds health_check{5000};
};

// Raised internally when an attempt outlives its timeout
class OperationTimeoutError : public std::runtime_error {
 public:
  OperationTimeoutError(OperationKind kind, std::chrono::milliseconds timeout)
      : std::runtime_error(std::string(ToString(kind)) + " timed out after " +
                           std::to_string(timeout.count()) + "ms"),
        kind_(kind),
        timeout_(timeout) {}

  OperationKind GetKind() const { return kind_; }
  std::chrono::milliseconds GetTimeout() const { return timeout_; }

 private:
  OperationKind kind_;
  std::chrono::milliseconds timeout_;
};

/**
 * @brief Runs remote operations with timeout, exponential backoff and jitter
 *
 * Every call consults the shared CircuitBreaker once, before the first
 * attempt. The breaker hears exactly one verdict per call: RecordSuccess on
 * the first successful attempt, RecordFailure once all attempts are spent.
 *
 * Operations must hand back a future that is satisfied by a promise (or
 * packaged task) owned elsewhere; a std::async future would block in its
 * destructor after a timeout.
 *
 * Execute blocks the calling thread for the whole retry sequence and must
 * not be called from the scheduler thread.
 */
class RetryExecutor {
 public:
  enum class Outcome {
    SUCCESS,
    CIRCUIT_OPEN,
    EXHAUSTED
  };

  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  RetryExecutor(CircuitBreaker& breaker,
                RetryPolicy policy = RetryPolicy(),
                OperationTimeouts timeouts = OperationTimeouts(),
                Sleeper sleeper = nullptr);
  ~RetryExecutor() = default;

  // Non-copyable, non-movable
  RetryExecutor(const RetryExecutor&) = delete;
  RetryExecutor& operator=(const RetryExecutor&) = delete;

  /**
   * @brief Run operation until it succeeds or attempts run out
   * @return value on success, nullopt when the circuit is open or all attempts failed
   */
  template <typename T>
  std::optional<T> Execute(const std::function<std::future<T>()>& operation,
                           OperationKind kind,
                           std::optional<std::chrono::milliseconds> timeout_override = std::nullopt,
                           Outcome* outcome = nullptr) {
    if (!breaker_.Allow()) {
      SPDLOG_DEBUG("RetryExecutor: {} rejected, circuit open", ToString(kind));
      SetOutcome(outcome, Outcome::CIRCUIT_OPEN);
      return std::nullopt;
    }

    const std::chrono::milliseconds timeout = timeout_override ? *timeout_override : GetTimeout(kind);
    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
      try {
        T value = RunAttempt(operation, kind, timeout);
        breaker_.RecordSuccess();
        SetOutcome(outcome, Outcome::SUCCESS);
        return value;
      } catch (const OperationTimeoutError& e) {
        SPDLOG_WARN("RetryExecutor: {} attempt {}/{}: {}",
                    ToString(kind), attempt, policy_.max_attempts, e.what());
      } catch (const std::exception& e) {
        SPDLOG_WARN("RetryExecutor: {} attempt {}/{} failed: {}",
                    ToString(kind), attempt, policy_.max_attempts, e.what());
      }

      if (attempt < policy_.max_attempts) {
        auto delay = ComputeBackoff(attempt);
        SPDLOG_DEBUG("RetryExecutor: retrying {} in {}ms", ToString(kind), delay.count());
        sleeper_(delay);
      }
    }

    breaker_.RecordFailure();
    SPDLOG_ERROR("RetryExecutor: {} failed after {} attempts", ToString(kind), policy_.max_attempts);
    SetOutcome(outcome, Outcome::EXHAUSTED);
    return std::nullopt;
  }

  // min(base * multiplier^(attempt-1), max_delay) with jitter, never below base
  std::chrono::milliseconds ComputeBackoff(int attempt);

  std::chrono::milliseconds GetTimeout(OperationKind kind) const;

  const RetryPolicy& GetPolicy() const { return policy_; }
  CircuitBreaker& GetCircuitBreaker() { return breaker_; }

 private:
  template <typename T>
  T RunAttempt(const std::function<std::future<T>()>& operation, OperationKind kind,
               std::chrono::milliseconds timeout) {
    std::future<T> result = operation();
    if (!result.valid()) {
      throw std::runtime_error("operation returned an empty future");
    }
    if (result.wait_for(timeout) != std::future_status::ready) {
      throw OperationTimeoutError(kind, timeout);
    }
    return result.get();
  }

  static void SetOutcome(Outcome* outcome, Outcome value) {
    if (outcome) {
      *outcome = value;
    }
  }

  CircuitBreaker& breaker_;
  RetryPolicy policy_;
  OperationTimeouts timeouts_;
  Sleeper sleeper_;

  std::mutex rng_mutex_;
  std::mt19937 rng_;
};

}  // namespace resilience
}  // namespace quell
