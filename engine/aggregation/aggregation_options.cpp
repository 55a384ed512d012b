#include "aggregation_options.hpp"
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace quell {
namespace aggregation {

using realtime::PriorityTier;
using realtime::TierSettings;

namespace {

constexpr PriorityTier kAllTiers[] = {
    PriorityTier::CRITICAL, PriorityTier::HIGH, PriorityTier::MEDIUM, PriorityTier::LOW};

size_t GetSize(const engine::common::ConfigManager& config, const std::string& key, size_t default_value) {
  int64_t value = config.GetInt64(key, static_cast<int64_t>(default_value));
  if (value < 0) {
    throw std::invalid_argument(key + " must not be negative");
  }
  return static_cast<size_t>(value);
}

void RequirePositive(std::chrono::milliseconds value, const std::string& name) {
  if (value.count() <= 0) {
    throw std::invalid_argument(name + " must be positive");
  }
}

}  // namespace

TierTable DefaultTierTable() {
  TierTable table;
  for (PriorityTier tier : kAllTiers) {
    table[tier] = realtime::DefaultTierSettings(tier);
  }
  return table;
}

const TierSettings& AggregationOptions::GetTier(PriorityTier tier) const {
  auto it = tiers.find(tier);
  if (it == tiers.end()) {
    throw std::invalid_argument(std::string("no settings for tier ") + realtime::ToString(tier));
  }
  return it->second;
}

AggregationOptions LoadAggregationOptions(const engine::common::ConfigManager& config) {
  AggregationOptions options;

  for (PriorityTier tier : kAllTiers) {
    const std::string prefix = std::string("aggregation.tiers.") + realtime::ToString(tier) + ".";
    TierSettings& settings = options.tiers[tier];
    settings.debounce = config.GetMilliseconds(prefix + "debounce_ms", settings.debounce);
    settings.max_batch_size = GetSize(config, prefix + "max_batch_size", settings.max_batch_size);
    settings.max_connections = GetSize(config, prefix + "max_connections", settings.max_connections);
  }

  PoolOptions& pool = options.pool;
  pool.max_total_connections =
      GetSize(config, "aggregation.pool.max_total_connections", pool.max_total_connections);
  pool.idle_timeout = config.GetMilliseconds("aggregation.pool.idle_timeout_ms", pool.idle_timeout);
  pool.sweep_interval = config.GetMilliseconds("aggregation.pool.sweep_interval_ms", pool.sweep_interval);
  pool.max_connection_errors =
      config.GetInt("aggregation.pool.max_connection_errors", pool.max_connection_errors);
  pool.enforce_tier_limits = config.GetBool("aggregation.pool.enforce_tier_limits", pool.enforce_tier_limits);

  auto& breaker = options.circuit_breaker;
  breaker.failure_threshold =
      config.GetInt("aggregation.circuit_breaker.failure_threshold", breaker.failure_threshold);
  breaker.success_threshold =
      config.GetInt("aggregation.circuit_breaker.success_threshold", breaker.success_threshold);
  breaker.open_timeout = config.GetMilliseconds("aggregation.circuit_breaker.timeout_ms", breaker.open_timeout);

  auto& retry = options.retry;
  retry.max_attempts = config.GetInt("aggregation.retry.max_attempts", retry.max_attempts);
  retry.base_delay = config.GetMilliseconds("aggregation.retry.base_delay_ms", retry.base_delay);
  retry.multiplier = config.GetDouble("aggregation.retry.multiplier", retry.multiplier);
  retry.max_delay = config.GetMilliseconds("aggregation.retry.max_delay_ms", retry.max_delay);
  retry.jitter = config.GetDouble("aggregation.retry.jitter", retry.jitter);

  auto& timeouts = options.timeouts;
  timeouts.command = config.GetMilliseconds("aggregation.timeouts.command_ms", timeouts.command);
  timeouts.batch = config.GetMilliseconds("aggregation.timeouts.batch_ms", timeouts.batch);
  timeouts.critical = config.GetMilliseconds("aggregation.timeouts.critical_ms", timeouts.critical);
  timeouts.health_check = config.GetMilliseconds("aggregation.timeouts.health_check_ms", timeouts.health_check);

  CacheOptions& cache = options.cache;
  cache.default_ttl = config.GetMilliseconds("aggregation.cache.default_ttl_ms", cache.default_ttl);
  cache.request_timeout = config.GetMilliseconds("aggregation.cache.request_timeout_ms", cache.request_timeout);
  cache.sweep_interval = config.GetMilliseconds("aggregation.cache.sweep_interval_ms", cache.sweep_interval);
  cache.remote_ttl = std::chrono::seconds(
      config.GetInt64("aggregation.cache.remote_ttl_seconds", cache.remote_ttl.count()));

  SPDLOG_DEBUG("Aggregation options loaded: pool ceiling {}, breaker {}/{}/{}ms, retry {}x",
               pool.max_total_connections, breaker.failure_threshold, breaker.success_threshold,
               breaker.open_timeout.count(), retry.max_attempts);
  return options;
}

void ValidateOptions(const AggregationOptions& options) {
  for (PriorityTier tier : kAllTiers) {
    const std::string name = std::string("tier ") + realtime::ToString(tier);
    const TierSettings& settings = options.GetTier(tier);
    RequirePositive(settings.debounce, name + " debounce");
    if (settings.max_batch_size == 0) {
      throw std::invalid_argument(name + " max_batch_size must be positive");
    }
    if (settings.max_connections == 0) {
      throw std::invalid_argument(name + " max_connections must be positive");
    }
  }

  if (options.pool.max_total_connections == 0) {
    throw std::invalid_argument("pool max_total_connections must be positive");
  }
  RequirePositive(options.pool.idle_timeout, "pool idle_timeout");
  RequirePositive(options.pool.sweep_interval, "pool sweep_interval");
  if (options.pool.max_connection_errors < 0) {
    throw std::invalid_argument("pool max_connection_errors must not be negative");
  }

  if (options.circuit_breaker.failure_threshold < 1 || options.circuit_breaker.success_threshold < 1) {
    throw std::invalid_argument("circuit breaker thresholds must be at least 1");
  }
  RequirePositive(options.circuit_breaker.open_timeout, "circuit breaker timeout");

  if (options.retry.max_attempts < 1) {
    throw std::invalid_argument("retry max_attempts must be at least 1");
  }
  if (options.retry.multiplier < 1.0) {
    throw std::invalid_argument("retry multiplier must be >= 1");
  }
  if (options.retry.jitter < 0.0 || options.retry.jitter >= 1.0) {
    throw std::invalid_argument("retry jitter must be in [0, 1)");
  }
  RequirePositive(options.retry.base_delay, "retry base_delay");
  if (options.retry.max_delay < options.retry.base_delay) {
    throw std::invalid_argument("retry max_delay must not be below base_delay");
  }

  RequirePositive(options.timeouts.command, "command timeout");
  RequirePositive(options.timeouts.batch, "batch timeout");
  RequirePositive(options.timeouts.critical, "critical timeout");
  RequirePositive(options.timeouts.health_check, "health check timeout");

  RequirePositive(options.cache.default_ttl, "cache default_ttl");
  RequirePositive(options.cache.request_timeout, "cache request_timeout");
  RequirePositive(options.cache.sweep_interval, "cache sweep_interval");
  if (options.cache.remote_ttl.count() <= 0) {
    throw std::invalid_argument("cache remote_ttl must be positive");
  }
}

}  // namespace aggregation
}  // namespace quell
