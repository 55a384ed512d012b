#pragma once

#include "engine/common/scheduler.hpp"

#include <chrono>
#include <mutex>
#include <optional>

namespace quell {
namespace resilience {

enum class CircuitState {
  CLOSED,
  OPEN,
  HALF_OPEN
};

const char* ToString(CircuitState state);

struct CircuitBreakerOptions {
  int failure_threshold = 5;  // Consecutive failures that open the circuit
  int success_threshold = 3;  // HALF_OPEN successes that close it again
  std::chrono::milliseconds open_timeout{60000};
};

// Point-in-time view for health endpoints and logs
struct CircuitBreakerStatus {
  CircuitState state = CircuitState::CLOSED;
  int failure_count = 0;
  int success_count = 0;
  std::optional<std::chrono::milliseconds> since_last_failure;
  // Remaining wait before an OPEN circuit admits a probe, zero otherwise
  std::chrono::milliseconds retry_after{0};
};

/**
 * @brief Three-state circuit breaker guarding one remote endpoint
 *
 * CLOSED admits everything. OPEN rejects until open_timeout has elapsed since
 * the last failure, then moves to HALF_OPEN and admits probes. In HALF_OPEN
 * success_threshold successes close the circuit; any failure reopens it.
 *
 * Thread-safe.
 */
class CircuitBreaker {
 public:
  explicit CircuitBreaker(CircuitBreakerOptions options = CircuitBreakerOptions(),
                          engine::common::TimeSource time_source = nullptr);
  ~CircuitBreaker() = default;

  // Non-copyable, non-movable (shared by reference)
  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  // May transition OPEN -> HALF_OPEN
  bool Allow();

  void RecordSuccess();
  void RecordFailure();

  // Manual recovery: back to CLOSED with counters cleared
  void Reset();

  CircuitState GetState() const;
  CircuitBreakerStatus GetStatus() const;
  const CircuitBreakerOptions& GetOptions() const { return options_; }

 private:
  void TransitionLocked(CircuitState next);

  CircuitBreakerOptions options_;
  engine::common::TimeSource now_;

  mutable std::mutex mutex_;
  CircuitState state_ = CircuitState::CLOSED;
  int failure_count_ = 0;
  int success_count_ = 0;
  std::optional<engine::common::SteadyClock::time_point> last_failure_;
};

}  // namespace resilience
}  // namespace quell
