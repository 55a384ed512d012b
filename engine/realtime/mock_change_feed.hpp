#pragma once

#include "engine/realtime/change_feed.hpp"
#include "engine/realtime/row_filter.hpp"

#include <atomic>
#include <string>

namespace quell {
namespace realtime {

/**
 * @brief In-process change feed
 *
 * Payloads handed to Publish() are routed synchronously, on the calling
 * thread, to every subscription whose table matches and whose row filter
 * accepts the row ("new" when present, otherwise "old"). Payloads are not
 * validated, so malformed input reaches subscribers unchanged.
 */
class MockChangeFeed : public ChangeFeed {
 public:
  MockChangeFeed();
  explicit MockChangeFeed(const engine::common::ConfigManager& config);
  ~MockChangeFeed() override = default;

  void Initialize(const engine::common::ConfigManager& config) override;
  bool Connect() override;
  void Disconnect() override;
  bool IsConnected() const override { return connected_.load(); }

  int Subscribe(const SubscriptionSpec& spec, PayloadCallback on_payload,
                FeedErrorCallback on_error) override;
  bool Unsubscribe(int subscription_id) override;

  // Route by payload["table"]; returns number of subscriptions notified
  size_t Publish(const nlohmann::json& payload);

  // Route by an explicit table (for payloads without a usable "table")
  size_t Publish(const std::string& table, const nlohmann::json& payload);

  // Report a subscription-level error to every subscription on table
  size_t InjectError(const std::string& table, const std::string& error);

  // Refuse new subscriptions (Subscribe returns -1)
  void SetRejectSubscriptions(bool reject) { reject_subscriptions_ = reject; }

  // Number of Subscribe calls accepted over the feed's lifetime
  size_t GetTotalSubscribeCalls() const { return total_subscribe_calls_.load(); }

 private:
  std::atomic<bool> connected_{true};
  std::atomic<bool> reject_subscriptions_{false};
  std::atomic<size_t> total_subscribe_calls_{0};
};

}  // namespace realtime
}  // namespace quell
