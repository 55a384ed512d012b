#pragma once

#include "engine/aggregation/aggregation_options.hpp"
#include "engine/aggregation/batch_engine.hpp"
#include "engine/common/scheduler.hpp"
#include "engine/realtime/change_event.hpp"
#include "engine/realtime/change_feed.hpp"
#include "engine/realtime/subscription_spec.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace quell {
namespace aggregation {

class ConnectionPool;

// Receives one event or a batch, on the scheduler thread
using ListenerCallback = std::function<void(const realtime::Delivery& delivery)>;

// Subscription-level failures: feed errors, malformed payloads, throwing listeners
using ErrorHook = std::function<void(const std::string& channel, const std::string& error)>;

/**
 * @brief RAII registration of one listener on a pooled connection
 *
 * Released on destruction. The handle that opened the connection owns it:
 * releasing that handle tears the connection down for every listener.
 * Handles that joined an existing connection only detach themselves; the
 * connection goes away when its last listener leaves.
 *
 * An empty handle (default-constructed or returned in degraded mode)
 * releases nothing. Release() is idempotent and safe after the pool is gone.
 */
class SubscriptionHandle {
 public:
  SubscriptionHandle() = default;

  SubscriptionHandle(std::weak_ptr<ConnectionPool> pool, uint64_t connection_id,
                     uint64_t listener_id, bool owner)
      : pool_(std::move(pool)), connection_id_(connection_id),
        listener_id_(listener_id), owner_(owner) {}

  ~SubscriptionHandle() { Release(); }

  // Non-copyable
  SubscriptionHandle(const SubscriptionHandle&) = delete;
  SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

  SubscriptionHandle(SubscriptionHandle&& other) noexcept
      : pool_(std::move(other.pool_)), connection_id_(other.connection_id_),
        listener_id_(other.listener_id_), owner_(other.owner_) {
    other.listener_id_ = 0;
  }

  SubscriptionHandle& operator=(SubscriptionHandle&& other) noexcept {
    if (this != &other) {
      Release();
      pool_ = std::move(other.pool_);
      connection_id_ = other.connection_id_;
      listener_id_ = other.listener_id_;
      owner_ = other.owner_;
      other.listener_id_ = 0;
    }
    return *this;
  }

  void Release();

  // False for empty handles (degraded mode) and after Release()
  bool IsActive() const { return listener_id_ != 0; }
  explicit operator bool() const { return IsActive(); }

  bool IsOwner() const { return owner_; }
  uint64_t GetConnectionId() const { return connection_id_; }
  uint64_t GetListenerId() const { return listener_id_; }

 private:
  std::weak_ptr<ConnectionPool> pool_;
  uint64_t connection_id_ = 0;
  uint64_t listener_id_ = 0;
  bool owner_ = false;
};

// Point-in-time view of one pooled connection
struct ConnectionMetrics {
  std::string channel;
  std::string pool_key;
  realtime::PriorityTier priority = realtime::PriorityTier::MEDIUM;
  size_t ref_count = 0;
  std::chrono::milliseconds idle_for{0};
  int error_count = 0;
  uint64_t message_count = 0;
  size_t pending_events = 0;
};

/**
 * @brief Shares feed subscriptions between channels with the same (table, filter)
 *
 * Acquire() order:
 *   1. live connections at the ceiling -> degraded (empty handle, warning)
 *   2. a connection with the same pool key and event kind -> join the least
 *      loaded one
 *   3. tier limit reached (when enforced) -> degraded
 *   4. open a new feed subscription and register the channel for batching
 *
 * Payloads are validated here; malformed ones are counted and reported to the
 * error hook, never delivered. Feed errors count against the connection,
 * which is torn down after max_connection_errors of them.
 *
 * Must be owned by a std::shared_ptr; handles and feed callbacks hold weak
 * references. Feeds must not call back synchronously from Subscribe().
 * No callback runs while the pool lock is held.
 */
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
 public:
  ConnectionPool(engine::common::Scheduler& scheduler, realtime::ChangeFeed& feed,
                 BatchEngine& batch_engine, PoolOptions options, TierTable tiers);
  ~ConnectionPool();

  // Non-copyable
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  SubscriptionHandle Acquire(const std::string& channel, const realtime::SubscriptionSpec& spec,
                             ListenerCallback callback);

  void SetErrorHook(ErrorHook hook);

  // Tears down connections idle longer than idle_timeout, returns how many
  size_t SweepIdle();

  // Tears down everything; later Acquire() calls are degraded
  void Shutdown();

  std::vector<ConnectionMetrics> GetMetrics() const;

  size_t GetLiveConnectionCount() const;
  size_t GetListenerCount() const;
  bool HasChannel(const std::string& channel) const;

  uint64_t GetDegradedCount() const;
  uint64_t GetMalformedCount() const;

  const PoolOptions& GetOptions() const { return options_; }

 private:
  friend class SubscriptionHandle;

  struct Listener {
    uint64_t id = 0;
    ListenerCallback callback;
  };

  struct PooledConnection {
    uint64_t id = 0;
    std::string channel;
    realtime::SubscriptionSpec spec;
    std::string pool_key;
    int feed_subscription_id = -1;
    engine::common::SteadyClock::time_point last_activity;
    int error_count = 0;
    uint64_t message_count = 0;
    std::vector<Listener> listeners;  // ref count == listeners.size()
  };

  void ReleaseListener(uint64_t connection_id, uint64_t listener_id, bool owner);

  void OnPayload(uint64_t connection_id, const nlohmann::json& payload);
  void OnFeedError(uint64_t connection_id, const std::string& error);
  void OnDelivery(uint64_t connection_id, const realtime::Delivery& delivery);

  // Counts an error; true when the connection should now be torn down
  bool CountErrorLocked(PooledConnection& connection);
  bool IsListening(uint64_t connection_id, uint64_t listener_id) const;

  // Removes the connection from the pool and the batch engine; the feed
  // subscription id is appended to *feed_ids for UnsubscribeFeeds
  void ExtractLocked(uint64_t connection_id, const char* reason, std::vector<int>* feed_ids);
  void UnsubscribeFeeds(const std::vector<int>& feed_ids);

  void ReportError(const ErrorHook& hook, const std::string& channel, const std::string& error);

  engine::common::Scheduler& scheduler_;
  realtime::ChangeFeed& feed_;
  BatchEngine& batch_engine_;
  PoolOptions options_;
  TierTable tiers_;

  mutable std::mutex mutex_;
  std::map<uint64_t, PooledConnection> connections_;
  std::unordered_map<std::string, uint64_t> channels_;  // channel -> connection id
  ErrorHook error_hook_;
  uint64_t next_connection_id_ = 1;
  uint64_t next_listener_id_ = 1;
  uint64_t degraded_count_ = 0;
  uint64_t malformed_count_ = 0;
  bool shut_down_ = false;
};

}  // namespace aggregation
}  // namespace quell
