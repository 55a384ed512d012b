#pragma once

#include "engine/common/config_manager.hpp"
#include "engine/realtime/subscription_spec.hpp"
#include "engine/resilience/circuit_breaker.hpp"
#include "engine/resilience/retry_executor.hpp"

#include <chrono>
#include <cstddef>
#include <map>

namespace quell {
namespace aggregation {

using TierTable = std::map<realtime::PriorityTier, realtime::TierSettings>;

// All four tiers with their built-in settings
TierTable DefaultTierTable();

struct PoolOptions {
  size_t max_total_connections = 10;
  std::chrono::milliseconds idle_timeout{300000};
  std::chrono::milliseconds sweep_interval{30000};
  int max_connection_errors = 5;  // Feed errors before a connection is torn down, 0 = never
  bool enforce_tier_limits = false;
};

struct CacheOptions {
  std::chrono::milliseconds default_ttl{5000};  // In-memory response cache
  std::chrono::milliseconds request_timeout{30000};
  std::chrono::milliseconds sweep_interval{60000};
  std::chrono::seconds remote_ttl{300};
};

struct AggregationOptions {
  TierTable tiers = DefaultTierTable();
  PoolOptions pool;
  resilience::CircuitBreakerOptions circuit_breaker;
  resilience::RetryPolicy retry;
  resilience::OperationTimeouts timeouts;
  CacheOptions cache;

  const realtime::TierSettings& GetTier(realtime::PriorityTier tier) const;
};

// Reads the aggregation.* section, falling back to defaults per key
AggregationOptions LoadAggregationOptions(const engine::common::ConfigManager& config);

// Throws std::invalid_argument naming the first bad value
void ValidateOptions(const AggregationOptions& options);

}  // namespace aggregation
}  // namespace quell
