#pragma once

#include "engine/aggregation/aggregation_options.hpp"
#include "engine/aggregation/batch_engine.hpp"
#include "engine/aggregation/connection_pool.hpp"
#include "engine/cache/remote_cache.hpp"
#include "engine/cache/remote_cache_client.hpp"
#include "engine/cache/request_deduplicator.hpp"
#include "engine/common/scheduler.hpp"
#include "engine/realtime/change_feed.hpp"
#include "engine/resilience/circuit_breaker.hpp"
#include "engine/resilience/retry_executor.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace quell {
namespace aggregation {

/**
 * @brief Entry point of the aggregation layer
 *
 * Wires the connection pool, the batching engine, the circuit breaker and
 * retry executor, the request deduplicator and the remote cache together.
 * Everything is owned here; the scheduler, change feed and remote cache
 * client are borrowed and must outlive the facade.
 *
 * Subscribe() and the monitoring calls are cheap and thread-safe.
 * ReadThroughCache() blocks for the remote round trips and must not run on
 * the scheduler thread.
 */
class AggregationFacade {
 public:
  using Fetch = std::function<cache::Value()>;

  // remote_client may be nullptr: the read-through cache is then memory-only
  // Throws std::invalid_argument when options do not validate
  AggregationFacade(engine::common::Scheduler& scheduler, realtime::ChangeFeed& feed,
                    cache::RemoteCacheClient* remote_client,
                    AggregationOptions options = AggregationOptions());
  ~AggregationFacade();

  // Non-copyable, non-movable
  AggregationFacade(const AggregationFacade&) = delete;
  AggregationFacade& operator=(const AggregationFacade&) = delete;

  /**
   * @brief Listen to a table through the shared pool
   *
   * The callback receives one event or a batch after the tier's debounce.
   * Dropping (or calling Release() on) the handle unsubscribes. An empty
   * handle means degraded mode: nothing will be delivered.
   */
  SubscriptionHandle Subscribe(const std::string& channel, const realtime::SubscriptionSpec& spec,
                               ListenerCallback callback);

  /**
   * @brief Memory cache, then remote cache, then fetch
   *
   * Concurrent calls for the same key share one lookup. A fetched value is
   * written back to the remote cache on a best-effort basis. ttl applies to
   * both tiers; when absent the memory tier uses cache.default_ttl and the
   * remote tier cache.remote_ttl.
   *
   * @return nullopt when fetch throws; never throws itself
   */
  std::optional<cache::Value> ReadThroughCache(const std::string& key, const Fetch& fetch,
                                               std::optional<std::chrono::seconds> ttl = std::nullopt);

  // Drops key from both tiers
  void Invalidate(const std::string& key);

  // Memory tier only; returns keys touched
  size_t InvalidatePrefix(const std::string& prefix);

  bool CheckRemoteCacheHealth();

  resilience::CircuitBreakerStatus GetCircuitBreakerStatus() const;
  void ResetCircuitBreaker();

  // Pool, breaker and cache counters as one document
  nlohmann::json GetMetrics() const;

  void SetErrorHook(ErrorHook hook);

  // Stops the sweeps and tears down every connection; idempotent
  void Shutdown();

  ConnectionPool& GetConnectionPool() { return *pool_; }
  BatchEngine& GetBatchEngine() { return batch_engine_; }
  cache::RequestDeduplicator& GetDeduplicator() { return deduplicator_; }
  const AggregationOptions& GetOptions() const { return options_; }

 private:
  AggregationOptions options_;
  engine::common::Scheduler& scheduler_;

  resilience::CircuitBreaker breaker_;
  resilience::RetryExecutor executor_;
  cache::RemoteCache remote_cache_;
  cache::RequestDeduplicator deduplicator_;
  BatchEngine batch_engine_;
  std::shared_ptr<ConnectionPool> pool_;

  int pool_sweep_id_ = -1;
  int cache_sweep_id_ = -1;
  std::atomic<bool> shut_down_{false};
};

}  // namespace aggregation
}  // namespace quell
