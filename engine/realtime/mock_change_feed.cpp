#include "mock_change_feed.hpp"
#include "engine/common/config_manager.hpp"
#include <spdlog/spdlog.h>

namespace quell {
namespace realtime {

namespace {

// Row the filter is evaluated against
const nlohmann::json& FilterRow(const nlohmann::json& payload) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  if (!payload.is_object()) {
    return kEmpty;
  }
  auto it = payload.find("new");
  if (it != payload.end() && it->is_object() && !it->empty()) {
    return *it;
  }
  it = payload.find("old");
  if (it != payload.end() && it->is_object()) {
    return *it;
  }
  return kEmpty;
}

}  // namespace

MockChangeFeed::MockChangeFeed()
    : ChangeFeed("mock") {
}

MockChangeFeed::MockChangeFeed(const engine::common::ConfigManager& config)
    : ChangeFeed("mock") {
  Initialize(config);
}

void MockChangeFeed::Initialize(const engine::common::ConfigManager& config) {
  reject_subscriptions_ = config.GetBool("realtime.mock.reject_subscriptions", false);
  SPDLOG_DEBUG("MockChangeFeed initialized - reject_subscriptions: {}", reject_subscriptions_.load());
}

bool MockChangeFeed::Connect() {
  connected_ = true;
  return true;
}

void MockChangeFeed::Disconnect() {
  connected_ = false;
  ClearSubscriptions();
}

int MockChangeFeed::Subscribe(const SubscriptionSpec& spec, PayloadCallback on_payload,
                              FeedErrorCallback on_error) {
  if (reject_subscriptions_.load()) {
    SPDLOG_WARN("MockChangeFeed: rejecting subscription for {}", spec.PoolKey());
    return -1;
  }

  RowFilter filter;
  std::string error;
  if (!RowFilter::Parse(spec.filter, &filter, &error)) {
    SPDLOG_WARN("MockChangeFeed: invalid filter for {}: {}", spec.table, error);
    return -1;
  }

  int id = AddSubscription(spec, std::move(on_payload), std::move(on_error));
  ++total_subscribe_calls_;
  SPDLOG_DEBUG("MockChangeFeed: subscription {} opened for {} ({})",
               id, spec.PoolKey(), ToString(spec.event_kind));
  return id;
}

bool MockChangeFeed::Unsubscribe(int subscription_id) {
  if (!RemoveSubscription(subscription_id)) {
    SPDLOG_WARN("MockChangeFeed: unknown subscription {}", subscription_id);
    return false;
  }
  SPDLOG_DEBUG("MockChangeFeed: subscription {} closed", subscription_id);
  return true;
}

size_t MockChangeFeed::Publish(const nlohmann::json& payload) {
  std::string table;
  if (payload.is_object() && payload.contains("table") && payload["table"].is_string()) {
    table = payload["table"].get<std::string>();
  }
  return Publish(table, payload);
}

size_t MockChangeFeed::Publish(const std::string& table, const nlohmann::json& payload) {
  if (!connected_.load()) {
    SPDLOG_DEBUG("MockChangeFeed: dropping payload for {} while disconnected", table);
    return 0;
  }

  // Server-side event kind filtering; unknown kinds pass through
  EventKind kind = EventKind::ANY;
  if (payload.is_object() && payload.contains("eventType") && payload["eventType"].is_string()) {
    ParseEventKind(payload["eventType"].get<std::string>(), &kind);
  }

  const nlohmann::json& row = FilterRow(payload);
  size_t delivered = 0;
  for (const auto& subscription : SnapshotSubscriptions()) {
    if (subscription.spec.table != table) {
      continue;
    }
    if (kind != EventKind::ANY && !subscription.spec.Accepts(kind)) {
      continue;
    }
    RowFilter filter;
    std::string error;
    if (RowFilter::Parse(subscription.spec.filter, &filter, &error) && !filter.Matches(row)) {
      continue;
    }
    NotifyPayload(subscription, payload);
    ++delivered;
  }
  return delivered;
}

size_t MockChangeFeed::InjectError(const std::string& table, const std::string& error) {
  size_t notified = 0;
  for (const auto& subscription : SnapshotSubscriptions()) {
    if (subscription.spec.table == table) {
      NotifyError(subscription, error);
      ++notified;
    }
  }
  return notified;
}

}  // namespace realtime
}  // namespace quell
