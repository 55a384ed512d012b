#pragma once

#include "engine/realtime/subscription_spec.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace quell {
namespace engine {
namespace common {
class ConfigManager;
}  // namespace common
}  // namespace engine

namespace realtime {

// Raw change payload: {eventType, table, new?, old?, commit_timestamp?}
using PayloadCallback = std::function<void(const nlohmann::json& payload)>;

// Subscription-level failure reported by the backend or the transport
using FeedErrorCallback = std::function<void(const std::string& error)>;

/**
 * @brief Abstract per-row change feed
 *
 * One Subscribe() call is one backend subscription for (table, filter,
 * event kind). Payloads are delivered on the scheduler thread and are NOT
 * validated here; that happens at the connection pool boundary.
 */
class ChangeFeed {
 public:
  explicit ChangeFeed(const std::string& feed_name);
  virtual ~ChangeFeed() = default;

  // Non-copyable, non-movable (callbacks capture this)
  ChangeFeed(const ChangeFeed&) = delete;
  ChangeFeed& operator=(const ChangeFeed&) = delete;

  // Initialize feed with configuration
  virtual void Initialize(const engine::common::ConfigManager& config) = 0;

  // Open the transport (no-op for in-process feeds)
  virtual bool Connect() = 0;

  virtual void Disconnect() = 0;

  virtual bool IsConnected() const = 0;

  // Returns subscription ID, -1 when the subscription was refused
  virtual int Subscribe(const SubscriptionSpec& spec, PayloadCallback on_payload,
                        FeedErrorCallback on_error) = 0;

  // Returns false for unknown IDs
  virtual bool Unsubscribe(int subscription_id) = 0;

  size_t GetSubscriptionCount() const;

  bool IsSubscribed(int subscription_id) const;

  const std::string& GetFeedName() const { return feed_name_; }

 protected:
  struct FeedSubscription {
    int id = -1;
    SubscriptionSpec spec;
    PayloadCallback on_payload;
    FeedErrorCallback on_error;
  };

  // Register subscription bookkeeping, returns its ID
  int AddSubscription(const SubscriptionSpec& spec, PayloadCallback on_payload,
                      FeedErrorCallback on_error);

  // Remove bookkeeping; copies the removed entry into *removed when given
  bool RemoveSubscription(int subscription_id, FeedSubscription* removed = nullptr);

  bool FindSubscription(int subscription_id, FeedSubscription* out) const;

  // Copy of all subscriptions, so callbacks run without the lock
  std::vector<FeedSubscription> SnapshotSubscriptions() const;

  void ClearSubscriptions();

  // Invoke callbacks, logging (not propagating) subscriber exceptions
  void NotifyPayload(const FeedSubscription& subscription, const nlohmann::json& payload);
  void NotifyError(const FeedSubscription& subscription, const std::string& error);

  std::string feed_name_;

 private:
  std::map<int, FeedSubscription> subscriptions_;
  mutable std::mutex subscribed_mutex_;
  int next_subscription_id_ = 1;
};

}  // namespace realtime
}  // namespace quell
