#include "aggregation_facade.hpp"
#include <spdlog/spdlog.h>

namespace quell {
namespace aggregation {

namespace {

AggregationOptions Validated(AggregationOptions options) {
  ValidateOptions(options);
  return options;
}

}  // namespace

//==============================================================================
// Lifecycle
//==============================================================================

AggregationFacade::AggregationFacade(engine::common::Scheduler& scheduler, realtime::ChangeFeed& feed,
                                     cache::RemoteCacheClient* remote_client, AggregationOptions options)
    : options_(Validated(std::move(options))),
      scheduler_(scheduler),
      breaker_(options_.circuit_breaker, scheduler.AsTimeSource()),
      executor_(breaker_, options_.retry, options_.timeouts),
      remote_cache_(remote_client, executor_),
      deduplicator_(options_.cache.default_ttl, options_.cache.request_timeout, scheduler.AsTimeSource()),
      batch_engine_(scheduler),
      pool_(std::make_shared<ConnectionPool>(scheduler, feed, batch_engine_, options_.pool, options_.tiers)) {
  pool_sweep_id_ = scheduler_.SchedulePeriodic(
      [this]() { pool_->SweepIdle(); }, options_.pool.sweep_interval);
  cache_sweep_id_ = scheduler_.SchedulePeriodic(
      [this]() {
        size_t removed = deduplicator_.SweepExpired();
        if (removed > 0) {
          SPDLOG_DEBUG("AggregationFacade: swept {} expired cache entries", removed);
        }
      },
      options_.cache.sweep_interval);

  if (pool_sweep_id_ < 0 || cache_sweep_id_ < 0) {
    SPDLOG_WARN("AggregationFacade: scheduler rejected periodic sweeps, idle connections will not be reclaimed");
  }

  SPDLOG_INFO("AggregationFacade: ready (feed {}, remote cache {}, ceiling {})",
              feed.GetFeedName(), remote_client ? remote_client->GetName() : std::string("none"),
              options_.pool.max_total_connections);
}

AggregationFacade::~AggregationFacade() {
  Shutdown();
}

void AggregationFacade::Shutdown() {
  if (shut_down_.exchange(true)) {
    return;
  }
  if (pool_sweep_id_ >= 0) {
    scheduler_.CancelPeriodic(pool_sweep_id_);
  }
  if (cache_sweep_id_ >= 0) {
    scheduler_.CancelPeriodic(cache_sweep_id_);
  }
  pool_sweep_id_ = -1;
  cache_sweep_id_ = -1;
  pool_->Shutdown();
  SPDLOG_INFO("AggregationFacade: shut down");
}

//==============================================================================
// Subscriptions
//==============================================================================

SubscriptionHandle AggregationFacade::Subscribe(const std::string& channel,
                                                const realtime::SubscriptionSpec& spec,
                                                ListenerCallback callback) {
  return pool_->Acquire(channel, spec, std::move(callback));
}

void AggregationFacade::SetErrorHook(ErrorHook hook) {
  pool_->SetErrorHook(std::move(hook));
}

//==============================================================================
// Read-through cache
//==============================================================================

std::optional<cache::Value> AggregationFacade::ReadThroughCache(const std::string& key, const Fetch& fetch,
                                                                std::optional<std::chrono::seconds> ttl) {
  const std::chrono::seconds remote_ttl = ttl ? *ttl : options_.cache.remote_ttl;

  cache::DedupeOptions dedupe_options;
  if (ttl) {
    dedupe_options.ttl = std::chrono::duration_cast<std::chrono::milliseconds>(*ttl);
  }

  auto lookup = [this, &key, &fetch, remote_ttl]() -> cache::Value {
    if (auto cached = remote_cache_.Get(key)) {
      SPDLOG_TRACE("AggregationFacade: remote hit for {}", key);
      return *cached;
    }

    cache::Value value = fetch();
    if (remote_cache_.IsAvailable() && !remote_cache_.Set(key, value, remote_ttl)) {
      SPDLOG_DEBUG("AggregationFacade: write-back of {} skipped", key);
    }
    return value;
  };

  try {
    return deduplicator_.Get(key, lookup, dedupe_options);
  } catch (const std::exception& e) {
    SPDLOG_WARN("AggregationFacade: read-through for {} failed: {}", key, e.what());
    return std::nullopt;
  }
}

void AggregationFacade::Invalidate(const std::string& key) {
  deduplicator_.Invalidate(key);
  if (remote_cache_.IsAvailable()) {
    remote_cache_.Del({key});
  }
}

size_t AggregationFacade::InvalidatePrefix(const std::string& prefix) {
  return deduplicator_.InvalidatePrefix(prefix);
}

bool AggregationFacade::CheckRemoteCacheHealth() {
  return remote_cache_.CheckHealth();
}

//==============================================================================
// Monitoring
//==============================================================================

resilience::CircuitBreakerStatus AggregationFacade::GetCircuitBreakerStatus() const {
  return breaker_.GetStatus();
}

void AggregationFacade::ResetCircuitBreaker() {
  breaker_.Reset();
}

nlohmann::json AggregationFacade::GetMetrics() const {
  nlohmann::json metrics;

  nlohmann::json connections = nlohmann::json::array();
  for (const auto& m : pool_->GetMetrics()) {
    connections.push_back({
        {"channel", m.channel},
        {"pool_key", m.pool_key},
        {"priority", realtime::ToString(m.priority)},
        {"ref_count", m.ref_count},
        {"idle_ms", m.idle_for.count()},
        {"error_count", m.error_count},
        {"message_count", m.message_count},
        {"pending_events", m.pending_events},
    });
  }
  metrics["connections"] = std::move(connections);
  metrics["live_connections"] = pool_->GetLiveConnectionCount();
  metrics["degraded_subscriptions"] = pool_->GetDegradedCount();
  metrics["malformed_events"] = pool_->GetMalformedCount();

  const auto status = breaker_.GetStatus();
  metrics["circuit_breaker"] = {
      {"state", resilience::ToString(status.state)},
      {"failure_count", status.failure_count},
      {"success_count", status.success_count},
      {"retry_after_ms", status.retry_after.count()},
  };

  metrics["cache"] = {
      {"size", deduplicator_.GetCacheSize()},
      {"pending", deduplicator_.GetPendingCount()},
  };
  return metrics;
}

}  // namespace aggregation
}  // namespace quell
