#pragma once

#include "engine/realtime/change_feed.hpp"
#include "engine/common/scheduler.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace quell {
namespace realtime {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// Websocket transport state; everything below ioc_ is touched only on io_thread_
struct RealtimeConnection {
  std::unique_ptr<net::io_context> ioc_;
  std::unique_ptr<ssl::context> ssl_ctx_;
  std::unique_ptr<tcp::resolver> resolver_;
  std::unique_ptr<websocket::stream<ssl::stream<beast::tcp_stream>>> ws_;
  std::unique_ptr<net::steady_timer> heartbeat_timer_;
  std::thread io_thread_;
  std::atomic<bool> connected_{false};
  std::atomic<bool> running_{false};

  std::string host_;
  std::string port_;
  std::string path_;

  beast::flat_buffer read_buffer_;
  std::deque<std::string> write_queue_;
};

/**
 * @brief Supabase Realtime client speaking the Phoenix channel protocol
 *
 * Each subscription joins its own topic with a postgres_changes config.
 * Incoming postgres_changes messages are translated to the raw change
 * payload shape and posted onto the scheduler thread. phx_error, phx_close
 * and join replies with status "error" go to the subscription's error
 * callback. A lost transport is reported to every subscription; the feed
 * does not reconnect on its own.
 *
 * Config (realtime.supabase.*): url, api_key ($QUELL_SUPABASE_KEY when
 * empty), schema, heartbeat_interval_ms, connect_timeout_ms.
 */
class SupabaseRealtimeFeed : public ChangeFeed {
 public:
  SupabaseRealtimeFeed(const engine::common::ConfigManager& config,
                       engine::common::Scheduler& scheduler);
  ~SupabaseRealtimeFeed() override;

  void Initialize(const engine::common::ConfigManager& config) override;
  bool Connect() override;
  void Disconnect() override;
  bool IsConnected() const override;

  int Subscribe(const SubscriptionSpec& spec, PayloadCallback on_payload,
                FeedErrorCallback on_error) override;
  bool Unsubscribe(int subscription_id) override;

  // Protocol helpers (public for tests)
  static std::string TopicFor(int subscription_id, const SubscriptionSpec& spec);
  static nlohmann::json BuildJoinMessage(const std::string& topic, const SubscriptionSpec& spec,
                                         const std::string& schema, const std::string& access_token,
                                         const std::string& ref);
  static nlohmann::json BuildLeaveMessage(const std::string& topic, const std::string& ref);
  static nlohmann::json BuildHeartbeatMessage(const std::string& ref);

  // postgres_changes payload -> {eventType, table, new, old, commit_timestamp}
  // Returns false (and leaves *out untouched) when "data" is missing
  static bool TranslatePostgresChange(const nlohmann::json& payload, nlohmann::json* out);

 private:
  engine::common::Scheduler& scheduler_;

  // Configuration
  std::string websocket_url_;
  std::string api_key_;
  std::string schema_;
  std::chrono::milliseconds heartbeat_interval_{30000};
  std::chrono::milliseconds connect_timeout_{10000};

  std::unique_ptr<RealtimeConnection> connection_;
  mutable std::mutex connection_mutex_;

  // topic -> subscription ID
  std::map<std::string, int> topics_;
  mutable std::mutex topics_mutex_;

  std::atomic<int> next_ref_{1};

  // Cleared on destruction so tasks still queued on the scheduler do nothing
  std::shared_ptr<std::atomic<bool>> alive_;

  std::string NextRef() { return std::to_string(next_ref_++); }
  bool FindTopicSubscription(const std::string& topic, int* subscription_id) const;

  // IO thread methods
  void RunIO(RealtimeConnection* conn);
  void QueueWrite(std::string message);
  void DoWrite(RealtimeConnection* conn);
  void DoRead(RealtimeConnection* conn);
  void OnRead(RealtimeConnection* conn, beast::error_code ec, std::size_t bytes_transferred);
  void ScheduleHeartbeat(RealtimeConnection* conn);
  void SendJoinAll();

  // Message routing
  void HandleMessage(const std::string& message);
  void DeliverPayload(int subscription_id, nlohmann::json payload);
  void DeliverError(int subscription_id, std::string error);
};

}  // namespace realtime
}  // namespace quell
