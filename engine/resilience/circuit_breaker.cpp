#include "circuit_breaker.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace quell {
namespace resilience {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

const char* ToString(CircuitState state) {
  switch (state) {
    case CircuitState::CLOSED: return "CLOSED";
    case CircuitState::OPEN: return "OPEN";
    case CircuitState::HALF_OPEN: return "HALF_OPEN";
  }
  return "CLOSED";
}

CircuitBreaker::CircuitBreaker(CircuitBreakerOptions options, engine::common::TimeSource time_source)
    : options_(options),
      now_(time_source ? std::move(time_source)
                       : engine::common::TimeSource([] { return engine::common::SteadyClock::now(); })) {
  if (options_.failure_threshold <= 0 || options_.success_threshold <= 0) {
    throw std::invalid_argument("CircuitBreaker thresholds must be positive");
  }
  if (options_.open_timeout.count() < 0) {
    throw std::invalid_argument("CircuitBreaker open_timeout must not be negative");
  }
}

bool CircuitBreaker::Allow() {
  std::lock_guard<std::mutex> lock(mutex_);
  switch (state_) {
    case CircuitState::CLOSED:
    case CircuitState::HALF_OPEN:
      return true;
    case CircuitState::OPEN:
      if (last_failure_ && now_() - *last_failure_ > options_.open_timeout) {
        TransitionLocked(CircuitState::HALF_OPEN);
        return true;
      }
      return false;
  }
  return false;
}

void CircuitBreaker::RecordSuccess() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++success_count_;
  if (state_ == CircuitState::HALF_OPEN && success_count_ >= options_.success_threshold) {
    TransitionLocked(CircuitState::CLOSED);
    failure_count_ = 0;
    success_count_ = 0;
  }
}

void CircuitBreaker::RecordFailure() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++failure_count_;
  success_count_ = 0;
  last_failure_ = now_();

  if (state_ == CircuitState::HALF_OPEN) {
    TransitionLocked(CircuitState::OPEN);
  } else if (state_ == CircuitState::CLOSED && failure_count_ >= options_.failure_threshold) {
    TransitionLocked(CircuitState::OPEN);
  }
}

void CircuitBreaker::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != CircuitState::CLOSED) {
    TransitionLocked(CircuitState::CLOSED);
  }
  failure_count_ = 0;
  success_count_ = 0;
  last_failure_.reset();
  SPDLOG_INFO("Circuit breaker manually reset");
}

CircuitState CircuitBreaker::GetState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

CircuitBreakerStatus CircuitBreaker::GetStatus() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CircuitBreakerStatus status;
  status.state = state_;
  status.failure_count = failure_count_;
  status.success_count = success_count_;
  if (last_failure_) {
    auto elapsed = duration_cast<milliseconds>(now_() - *last_failure_);
    status.since_last_failure = elapsed;
    if (state_ == CircuitState::OPEN && elapsed < options_.open_timeout) {
      status.retry_after = options_.open_timeout - elapsed;
    }
  }
  return status;
}

void CircuitBreaker::TransitionLocked(CircuitState next) {
  if (next == CircuitState::OPEN) {
    SPDLOG_WARN("Circuit breaker {} -> OPEN after {} failures, retry in {}ms",
                ToString(state_), failure_count_, options_.open_timeout.count());
  } else {
    SPDLOG_INFO("Circuit breaker {} -> {}", ToString(state_), ToString(next));
  }
  state_ = next;
}

}  // namespace resilience
}  // namespace quell
