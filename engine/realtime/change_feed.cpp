#include "change_feed.hpp"
#include <spdlog/spdlog.h>

namespace quell {
namespace realtime {

ChangeFeed::ChangeFeed(const std::string& feed_name)
    : feed_name_(feed_name) {
}

size_t ChangeFeed::GetSubscriptionCount() const {
  std::lock_guard<std::mutex> lock(subscribed_mutex_);
  return subscriptions_.size();
}

bool ChangeFeed::IsSubscribed(int subscription_id) const {
  std::lock_guard<std::mutex> lock(subscribed_mutex_);
  return subscriptions_.count(subscription_id) > 0;
}

int ChangeFeed::AddSubscription(const SubscriptionSpec& spec, PayloadCallback on_payload,
                                FeedErrorCallback on_error) {
  std::lock_guard<std::mutex> lock(subscribed_mutex_);
  int id = next_subscription_id_++;
  FeedSubscription& subscription = subscriptions_[id];
  subscription.id = id;
  subscription.spec = spec;
  subscription.on_payload = std::move(on_payload);
  subscription.on_error = std::move(on_error);
  return id;
}

bool ChangeFeed::RemoveSubscription(int subscription_id, FeedSubscription* removed) {
  std::lock_guard<std::mutex> lock(subscribed_mutex_);
  auto it = subscriptions_.find(subscription_id);
  if (it == subscriptions_.end()) {
    return false;
  }
  if (removed) {
    *removed = std::move(it->second);
  }
  subscriptions_.erase(it);
  return true;
}

bool ChangeFeed::FindSubscription(int subscription_id, FeedSubscription* out) const {
  std::lock_guard<std::mutex> lock(subscribed_mutex_);
  auto it = subscriptions_.find(subscription_id);
  if (it == subscriptions_.end()) {
    return false;
  }
  *out = it->second;
  return true;
}

std::vector<ChangeFeed::FeedSubscription> ChangeFeed::SnapshotSubscriptions() const {
  std::lock_guard<std::mutex> lock(subscribed_mutex_);
  std::vector<FeedSubscription> result;
  result.reserve(subscriptions_.size());
  for (const auto& [id, subscription] : subscriptions_) {
    result.push_back(subscription);
  }
  return result;
}

void ChangeFeed::ClearSubscriptions() {
  std::lock_guard<std::mutex> lock(subscribed_mutex_);
  subscriptions_.clear();
}

void ChangeFeed::NotifyPayload(const FeedSubscription& subscription, const nlohmann::json& payload) {
  SPDLOG_TRACE("ChangeFeed {}: payload for subscription {} ({})",
               feed_name_, subscription.id, subscription.spec.PoolKey());
  if (!subscription.on_payload) {
    return;
  }
  try {
    subscription.on_payload(payload);
  } catch (const std::exception& e) {
    SPDLOG_ERROR("ChangeFeed {}: payload callback for subscription {} threw: {}",
                 feed_name_, subscription.id, e.what());
  }
}

void ChangeFeed::NotifyError(const FeedSubscription& subscription, const std::string& error) {
  SPDLOG_WARN("ChangeFeed {}: subscription {} ({}) error: {}",
              feed_name_, subscription.id, subscription.spec.PoolKey(), error);
  if (!subscription.on_error) {
    return;
  }
  try {
    subscription.on_error(error);
  } catch (const std::exception& e) {
    SPDLOG_ERROR("ChangeFeed {}: error callback for subscription {} threw: {}",
                 feed_name_, subscription.id, e.what());
  }
}

}  // namespace realtime
}  // namespace quell
