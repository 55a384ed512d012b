#include "retry_executor.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace quell {
namespace resilience {

const char* ToString(OperationKind kind) {
  switch (kind) {
    case OperationKind::GET: return "GET";
    case OperationKind::SET: return "SET";
    case OperationKind::DEL: return "DEL";
    case OperationKind::BATCH: return "BATCH";
    case OperationKind::CRITICAL: return "CRITICAL";
    case OperationKind::HEALTH_CHECK: return "HEALTH_CHECK";
  }
  return "UNKNOWN";
}

RetryExecutor::RetryExecutor(CircuitBreaker& breaker, RetryPolicy policy,
                             OperationTimeouts timeouts, Sleeper sleeper)
    : breaker_(breaker),
      policy_(policy),
      timeouts_(timeouts),
      sleeper_(sleeper ? std::move(sleeper)
                       : Sleeper([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })),
      rng_(std::random_device{}()) {
  if (policy_.max_attempts < 1) {
    throw std::invalid_argument("RetryPolicy max_attempts must be at least 1");
  }
  if (policy_.multiplier < 1.0) {
    throw std::invalid_argument("RetryPolicy multiplier must be at least 1");
  }
  if (policy_.jitter < 0.0 || policy_.jitter >= 1.0) {
    throw std::invalid_argument("RetryPolicy jitter must be in [0, 1)");
  }
}

std::chrono::milliseconds RetryExecutor::ComputeBackoff(int attempt) {
  const double base = static_cast<double>(policy_.base_delay.count());
  double delay = base * std::pow(policy_.multiplier, std::max(0, attempt - 1));
  delay = std::min(delay, static_cast<double>(policy_.max_delay.count()));

  if (policy_.jitter > 0.0) {
    std::uniform_real_distribution<double> dist(-policy_.jitter, policy_.jitter);
    double factor;
    {
      std::lock_guard<std::mutex> lock(rng_mutex_);
      factor = dist(rng_);
    }
    delay += delay * factor;
  }

  delay = std::max(delay, base);
  return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay)));
}

std::chrono::milliseconds RetryExecutor::GetTimeout(OperationKind kind) const {
  switch (kind) {
    case OperationKind::GET:
    case OperationKind::SET:
    case OperationKind::DEL:
      return timeouts_.command;
    case OperationKind::BATCH:
      return timeouts_.batch;
    case OperationKind::CRITICAL:
      return timeouts_.critical;
    case OperationKind::HEALTH_CHECK:
      return timeouts_.health_check;
  }
  return timeouts_.command;
}

}  // namespace resilience
}  // namespace quell
