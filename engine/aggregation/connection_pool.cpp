#include "connection_pool.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace quell {
namespace aggregation {

using realtime::ChangeEvent;
using realtime::Delivery;
using realtime::SubscriptionSpec;

//==============================================================================
// SubscriptionHandle
//==============================================================================

void SubscriptionHandle::Release() {
  if (listener_id_ == 0) {
    return;
  }
  uint64_t listener_id = listener_id_;
  listener_id_ = 0;
  if (auto pool = pool_.lock()) {
    pool->ReleaseListener(connection_id_, listener_id, owner_);
  }
  pool_.reset();
}

//==============================================================================
// Lifecycle
//==============================================================================

ConnectionPool::ConnectionPool(engine::common::Scheduler& scheduler, realtime::ChangeFeed& feed,
                               BatchEngine& batch_engine, PoolOptions options, TierTable tiers)
    : scheduler_(scheduler),
      feed_(feed),
      batch_engine_(batch_engine),
      options_(options),
      tiers_(std::move(tiers)) {
}

ConnectionPool::~ConnectionPool() {
  Shutdown();
}

void ConnectionPool::SetErrorHook(ErrorHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_hook_ = std::move(hook);
}

//==============================================================================
// Acquire / release
//==============================================================================

SubscriptionHandle ConnectionPool::Acquire(const std::string& channel, const SubscriptionSpec& spec,
                                           ListenerCallback callback) {
  if (!callback) {
    throw std::invalid_argument("ConnectionPool: listener callback for " + channel + " is empty");
  }

  std::vector<int> stale_feed_ids;
  ErrorHook refused_hook;
  bool refused = false;
  SubscriptionHandle handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      ++degraded_count_;
      SPDLOG_WARN("ConnectionPool: {} requested after shutdown, running without live updates", channel);
      return SubscriptionHandle();
    }

    // A channel name maps to one connection; acquiring it again replaces it
    auto existing = channels_.find(channel);
    if (existing != channels_.end()) {
      ExtractLocked(existing->second, "channel re-acquired", &stale_feed_ids);
    }

    const auto now = scheduler_.Now();
    const std::string pool_key = spec.PoolKey();

    if (connections_.size() >= options_.max_total_connections) {
      ++degraded_count_;
      SPDLOG_WARN("ConnectionPool: {} live connections at ceiling, {} runs without live updates",
                  connections_.size(), channel);
    } else {
      // Least-loaded connection for the same (table, filter, event kind)
      PooledConnection* shared = nullptr;
      for (auto& [id, connection] : connections_) {
        if (connection.pool_key != pool_key || connection.spec.event_kind != spec.event_kind) {
          continue;
        }
        if (shared == nullptr || connection.listeners.size() < shared->listeners.size()) {
          shared = &connection;
        }
      }

      if (shared != nullptr) {
        uint64_t listener_id = next_listener_id_++;
        shared->listeners.push_back(Listener{listener_id, std::move(callback)});
        shared->last_activity = now;
        SPDLOG_DEBUG("ConnectionPool: {} joins connection {} ({}), ref count {}",
                     channel, shared->id, shared->channel, shared->listeners.size());
        handle = SubscriptionHandle(weak_from_this(), shared->id, listener_id, false);
      } else {
        auto tier_it = tiers_.find(spec.priority);
        const realtime::TierSettings settings =
            tier_it != tiers_.end() ? tier_it->second : realtime::DefaultTierSettings(spec.priority);

        size_t tier_connections = 0;
        for (const auto& [id, connection] : connections_) {
          if (connection.spec.priority == spec.priority) {
            ++tier_connections;
          }
        }

        if (options_.enforce_tier_limits && tier_connections >= settings.max_connections) {
          ++degraded_count_;
          SPDLOG_WARN("ConnectionPool: tier {} at its limit of {} connections, {} runs without live updates",
                      realtime::ToString(spec.priority), settings.max_connections, channel);
        } else {
          const uint64_t connection_id = next_connection_id_++;
          std::weak_ptr<ConnectionPool> self = weak_from_this();

          int feed_id = feed_.Subscribe(
              spec,
              [self, connection_id](const nlohmann::json& payload) {
                if (auto pool = self.lock()) {
                  pool->OnPayload(connection_id, payload);
                }
              },
              [self, connection_id](const std::string& error) {
                if (auto pool = self.lock()) {
                  pool->OnFeedError(connection_id, error);
                }
              });

          if (feed_id < 0) {
            refused = true;
            refused_hook = error_hook_;
          } else {
            try {
              batch_engine_.Register(channel, settings,
                                     [self, connection_id](const std::string&, const Delivery& delivery) {
                                       if (auto pool = self.lock()) {
                                         pool->OnDelivery(connection_id, delivery);
                                       }
                                     });
            } catch (const std::invalid_argument&) {
              feed_.Unsubscribe(feed_id);
              throw;
            }

            PooledConnection connection;
            connection.id = connection_id;
            connection.channel = channel;
            connection.spec = spec;
            connection.pool_key = pool_key;
            connection.feed_subscription_id = feed_id;
            connection.last_activity = now;
            uint64_t listener_id = next_listener_id_++;
            connection.listeners.push_back(Listener{listener_id, std::move(callback)});
            connections_.emplace(connection_id, std::move(connection));
            channels_[channel] = connection_id;

            SPDLOG_INFO("ConnectionPool: opened connection {} for {} ({}, {}, tier {}), {} live",
                        connection_id, channel, pool_key, realtime::ToString(spec.event_kind),
                        realtime::ToString(spec.priority), connections_.size());
            handle = SubscriptionHandle(self, connection_id, listener_id, true);
          }
        }
      }
    }
  }

  UnsubscribeFeeds(stale_feed_ids);
  if (refused) {
    SPDLOG_ERROR("ConnectionPool: feed {} refused subscription for {}", feed_.GetFeedName(), channel);
    ReportError(refused_hook, channel, "subscription refused by feed " + feed_.GetFeedName());
  }
  return handle;
}

void ConnectionPool::ReleaseListener(uint64_t connection_id, uint64_t listener_id, bool owner) {
  std::vector<int> feed_ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      return;  // Already torn down
    }

    PooledConnection& connection = it->second;
    if (owner) {
      ExtractLocked(connection_id, "owner released", &feed_ids);
    } else {
      auto& listeners = connection.listeners;
      for (auto l = listeners.begin(); l != listeners.end(); ++l) {
        if (l->id == listener_id) {
          listeners.erase(l);
          break;
        }
      }
      SPDLOG_DEBUG("ConnectionPool: listener {} left connection {}, ref count {}",
                   listener_id, connection_id, listeners.size());
      if (listeners.empty()) {
        ExtractLocked(connection_id, "last listener released", &feed_ids);
      }
    }
  }
  UnsubscribeFeeds(feed_ids);
}

//==============================================================================
// Feed and batch callbacks
//==============================================================================

void ConnectionPool::OnPayload(uint64_t connection_id, const nlohmann::json& payload) {
  ChangeEvent event;
  std::string parse_error;
  const bool valid = realtime::ParseChangeEvent(payload, &event, &parse_error);

  std::string channel;
  ErrorHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      return;
    }
    PooledConnection& connection = it->second;
    connection.last_activity = scheduler_.Now();
    channel = connection.channel;

    if (!valid) {
      ++malformed_count_;
      hook = error_hook_;
    } else if (!connection.spec.Accepts(realtime::GetEventKind(event))) {
      SPDLOG_TRACE("ConnectionPool: {} ignores {} event", channel,
                   realtime::ToString(realtime::GetEventKind(event)));
      return;
    } else {
      ++connection.message_count;
    }
  }

  if (!valid) {
    SPDLOG_WARN("ConnectionPool: dropping malformed payload on {}: {}", channel, parse_error);
    ReportError(hook, channel, "malformed change payload: " + parse_error);
    return;
  }
  batch_engine_.OnEvent(channel, std::move(event));
}

void ConnectionPool::OnFeedError(uint64_t connection_id, const std::string& error) {
  std::vector<int> feed_ids;
  std::string channel;
  ErrorHook hook;
  int error_count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      return;
    }
    channel = it->second.channel;
    hook = error_hook_;
    bool exhausted = CountErrorLocked(it->second);
    error_count = it->second.error_count;
    if (exhausted) {
      ExtractLocked(connection_id, "too many errors", &feed_ids);
    }
  }

  SPDLOG_WARN("ConnectionPool: feed error on {} ({} so far): {}", channel, error_count, error);
  ReportError(hook, channel, error);
  UnsubscribeFeeds(feed_ids);
}

bool ConnectionPool::IsListening(uint64_t connection_id, uint64_t listener_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return false;
  }
  const auto& listeners = it->second.listeners;
  return std::any_of(listeners.begin(), listeners.end(),
                     [listener_id](const Listener& listener) { return listener.id == listener_id; });
}

void ConnectionPool::OnDelivery(uint64_t connection_id, const Delivery& delivery) {
  std::vector<Listener> listeners;
  std::string channel;
  ErrorHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      return;
    }
    listeners = it->second.listeners;
    channel = it->second.channel;
    hook = error_hook_;
  }

  int failures = 0;
  for (const auto& listener : listeners) {
    // An earlier listener may have released this one or torn the connection down
    if (!IsListening(connection_id, listener.id)) {
      continue;
    }
    try {
      listener.callback(delivery);
    } catch (const std::exception& e) {
      ++failures;
      SPDLOG_ERROR("ConnectionPool: listener {} on {} threw: {}", listener.id, channel, e.what());
      ReportError(hook, channel, std::string("listener failed: ") + e.what());
    }
  }

  if (failures == 0) {
    return;
  }

  std::vector<int> feed_ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      return;
    }
    for (int i = 0; i < failures; ++i) {
      if (CountErrorLocked(it->second)) {
        ExtractLocked(connection_id, "too many errors", &feed_ids);
        break;
      }
    }
  }
  UnsubscribeFeeds(feed_ids);
}

//==============================================================================
// Maintenance
//==============================================================================

size_t ConnectionPool::SweepIdle() {
  std::vector<int> feed_ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = scheduler_.Now();
    std::vector<uint64_t> idle;
    for (const auto& [id, connection] : connections_) {
      if (now - connection.last_activity > options_.idle_timeout) {
        idle.push_back(id);
      }
    }
    for (uint64_t id : idle) {
      ExtractLocked(id, "idle", &feed_ids);
    }
  }

  if (!feed_ids.empty()) {
    SPDLOG_INFO("ConnectionPool: swept {} idle connections", feed_ids.size());
  }
  UnsubscribeFeeds(feed_ids);
  return feed_ids.size();
}

void ConnectionPool::Shutdown() {
  std::vector<int> feed_ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_ && connections_.empty()) {
      return;
    }
    shut_down_ = true;
    while (!connections_.empty()) {
      ExtractLocked(connections_.begin()->first, "shutdown", &feed_ids);
    }
  }
  UnsubscribeFeeds(feed_ids);
  SPDLOG_INFO("ConnectionPool: shut down, {} connections closed", feed_ids.size());
}

//==============================================================================
// Monitoring
//==============================================================================

std::vector<ConnectionMetrics> ConnectionPool::GetMetrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = scheduler_.Now();
  std::vector<ConnectionMetrics> metrics;
  metrics.reserve(connections_.size());
  for (const auto& [id, connection] : connections_) {
    ConnectionMetrics m;
    m.channel = connection.channel;
    m.pool_key = connection.pool_key;
    m.priority = connection.spec.priority;
    m.ref_count = connection.listeners.size();
    m.idle_for = std::chrono::duration_cast<std::chrono::milliseconds>(now - connection.last_activity);
    m.error_count = connection.error_count;
    m.message_count = connection.message_count;
    m.pending_events = batch_engine_.GetPendingCount(connection.channel);
    metrics.push_back(std::move(m));
  }
  return metrics;
}

size_t ConnectionPool::GetLiveConnectionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

size_t ConnectionPool::GetListenerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& [id, connection] : connections_) {
    count += connection.listeners.size();
  }
  return count;
}

bool ConnectionPool::HasChannel(const std::string& channel) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return channels_.count(channel) > 0;
}

uint64_t ConnectionPool::GetDegradedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return degraded_count_;
}

uint64_t ConnectionPool::GetMalformedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return malformed_count_;
}

//==============================================================================
// Helpers (private)
//==============================================================================

bool ConnectionPool::CountErrorLocked(PooledConnection& connection) {
  ++connection.error_count;
  return options_.max_connection_errors > 0 && connection.error_count >= options_.max_connection_errors;
}

void ConnectionPool::ExtractLocked(uint64_t connection_id, const char* reason, std::vector<int>* feed_ids) {
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return;
  }

  const PooledConnection& connection = it->second;
  auto channel_it = channels_.find(connection.channel);
  if (channel_it != channels_.end() && channel_it->second == connection_id) {
    channels_.erase(channel_it);
    batch_engine_.Remove(connection.channel);
  }
  feed_ids->push_back(connection.feed_subscription_id);

  SPDLOG_INFO("ConnectionPool: closing connection {} for {} ({}), {} listeners, {} messages",
              connection_id, connection.channel, reason, connection.listeners.size(),
              connection.message_count);
  connections_.erase(it);
}

void ConnectionPool::UnsubscribeFeeds(const std::vector<int>& feed_ids) {
  for (int feed_id : feed_ids) {
    if (!feed_.Unsubscribe(feed_id)) {
      SPDLOG_DEBUG("ConnectionPool: feed subscription {} already gone", feed_id);
    }
  }
}

void ConnectionPool::ReportError(const ErrorHook& hook, const std::string& channel, const std::string& error) {
  if (!hook) {
    return;
  }
  try {
    hook(channel, error);
  } catch (const std::exception& e) {
    SPDLOG_ERROR("ConnectionPool: error hook threw for {}: {}", channel, e.what());
  }
}

}  // namespace aggregation
}  // namespace quell
