#include "supabase_realtime_feed.hpp"
#include "engine/common/config_manager.hpp"
#include "engine/common/util.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <cstdlib>
#include <future>

namespace quell {
namespace realtime {

namespace {

constexpr const char* kPhoenixTopic = "phoenix";

std::string StringField(const nlohmann::json& node, const char* field) {
  if (node.is_object()) {
    auto it = node.find(field);
    if (it != node.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return "";
}

// Tear down a connection from outside its IO thread
void StopConnection(RealtimeConnection* conn) {
  if (!conn) {
    return;
  }

  if (conn->connected_.exchange(false) && conn->ioc_ && conn->ws_) {
    // Give the server a close frame before the loop goes away
    auto closed = std::make_shared<std::promise<void>>();
    auto closed_future = closed->get_future();
    net::post(*conn->ioc_, [conn, closed]() {
      if (conn->heartbeat_timer_) {
        conn->heartbeat_timer_->cancel();
      }
      conn->ws_->async_close(websocket::close_code::normal,
                             [closed](beast::error_code) { closed->set_value(); });
    });
    closed_future.wait_for(std::chrono::milliseconds(500));
  }

  conn->running_ = false;
  if (conn->ioc_) {
    conn->ioc_->stop();
  }
  if (conn->io_thread_.joinable()) {
    conn->io_thread_.join();
  }
  if (conn->ws_) {
    beast::error_code ec;
    beast::get_lowest_layer(*conn->ws_).socket().close(ec);
  }
}

}  // namespace

//==============================================================================
// Lifecycle
//==============================================================================

SupabaseRealtimeFeed::SupabaseRealtimeFeed(const engine::common::ConfigManager& config,
                                           engine::common::Scheduler& scheduler)
    : ChangeFeed("supabase_realtime"),
      scheduler_(scheduler),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
  Initialize(config);
}

SupabaseRealtimeFeed::~SupabaseRealtimeFeed() {
  alive_->store(false);
  Disconnect();
}

void SupabaseRealtimeFeed::Initialize(const engine::common::ConfigManager& config) {
  websocket_url_ = config.GetString("realtime.supabase.url", "");
  api_key_ = config.GetString("realtime.supabase.api_key", "");
  if (api_key_.empty()) {
    const char* env = std::getenv("QUELL_SUPABASE_KEY");
    if (env) {
      api_key_ = env;
    }
  }
  schema_ = config.GetString("realtime.supabase.schema", "public");
  heartbeat_interval_ = config.GetMilliseconds("realtime.supabase.heartbeat_interval_ms",
                                               std::chrono::milliseconds(30000));
  connect_timeout_ = config.GetMilliseconds("realtime.supabase.connect_timeout_ms",
                                            std::chrono::milliseconds(10000));

  SPDLOG_INFO("SupabaseRealtimeFeed initialized - url: {}, schema: {}, heartbeat: {}ms, api_key set: {}",
              websocket_url_, schema_, heartbeat_interval_.count(), !api_key_.empty());
}

//==============================================================================
// Connection
//==============================================================================

bool SupabaseRealtimeFeed::Connect() {
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    if (connection_ && connection_->connected_.load()) {
      return true;
    }
    if (websocket_url_.empty()) {
      SPDLOG_ERROR("SupabaseRealtimeFeed: realtime.supabase.url is not configured");
      return false;
    }

    auto parsed = engine::common::ParseUrl(websocket_url_, "wss");
    if (!parsed.IsSecure()) {
      SPDLOG_ERROR("SupabaseRealtimeFeed: only wss:// endpoints are supported, got {}", websocket_url_);
      return false;
    }

    if (connection_) {
      StopConnection(connection_.get());
      connection_.reset();
    }

    auto conn = std::make_unique<RealtimeConnection>();
    conn->host_ = parsed.host;
    conn->port_ = parsed.port;
    conn->path_ = parsed.path + (parsed.path.find('?') == std::string::npos ? "?" : "&") +
                  "apikey=" + engine::common::UrlEncode(api_key_) + "&vsn=1.0.0";

    try {
      conn->ioc_ = std::make_unique<net::io_context>();
      conn->ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tlsv12_client);
      conn->ssl_ctx_->set_default_verify_paths();
      conn->ssl_ctx_->set_verify_mode(ssl::verify_peer);
      conn->ssl_ctx_->set_verify_callback(ssl::host_name_verification(conn->host_));
      conn->resolver_ = std::make_unique<tcp::resolver>(*conn->ioc_);
      conn->ws_ = std::make_unique<websocket::stream<ssl::stream<beast::tcp_stream>>>(
          *conn->ioc_, *conn->ssl_ctx_);
      conn->heartbeat_timer_ = std::make_unique<net::steady_timer>(*conn->ioc_);
    } catch (const std::exception& e) {
      SPDLOG_ERROR("SupabaseRealtimeFeed: failed to set up connection: {}", e.what());
      return false;
    }

    SPDLOG_DEBUG("SupabaseRealtimeFeed: connecting to {}:{}", conn->host_, conn->port_);

    auto handshake = std::make_shared<std::promise<bool>>();
    auto handshake_done = handshake->get_future();
    RealtimeConnection* raw = conn.get();

    raw->resolver_->async_resolve(raw->host_, raw->port_,
        [raw, handshake](beast::error_code ec, tcp::resolver::results_type results) {
          if (ec) {
            SPDLOG_ERROR("SupabaseRealtimeFeed: resolve error: {}", ec.message());
            handshake->set_value(false);
            return;
          }
          beast::get_lowest_layer(*raw->ws_).expires_after(std::chrono::seconds(30));
          beast::get_lowest_layer(*raw->ws_).async_connect(results,
              [raw, handshake](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                if (ec) {
                  SPDLOG_ERROR("SupabaseRealtimeFeed: connect error: {}", ec.message());
                  handshake->set_value(false);
                  return;
                }
                // SNI
                if (!SSL_set_tlsext_host_name(raw->ws_->next_layer().native_handle(), raw->host_.c_str())) {
                  SPDLOG_ERROR("SupabaseRealtimeFeed: failed to set SNI host {}", raw->host_);
                  handshake->set_value(false);
                  return;
                }
                raw->ws_->next_layer().async_handshake(ssl::stream_base::client,
                    [raw, handshake](beast::error_code ec) {
                      if (ec) {
                        SPDLOG_ERROR("SupabaseRealtimeFeed: SSL handshake error: {}", ec.message());
                        handshake->set_value(false);
                        return;
                      }
                      beast::get_lowest_layer(*raw->ws_).expires_never();
                      raw->ws_->set_option(
                          websocket::stream_base::timeout::suggested(beast::role_type::client));
                      raw->ws_->async_handshake(raw->host_, raw->path_,
                          [raw, handshake](beast::error_code ec) {
                            if (ec) {
                              SPDLOG_ERROR("SupabaseRealtimeFeed: websocket handshake error: {}",
                                           ec.message());
                              handshake->set_value(false);
                              return;
                            }
                            raw->connected_ = true;
                            handshake->set_value(true);
                          });
                    });
              });
        });

    raw->running_ = true;
    raw->io_thread_ = std::thread(&SupabaseRealtimeFeed::RunIO, this, raw);
    connection_ = std::move(conn);

    if (handshake_done.wait_for(connect_timeout_) != std::future_status::ready ||
        !handshake_done.get()) {
      SPDLOG_ERROR("SupabaseRealtimeFeed: failed to connect to {} within {}ms",
                   websocket_url_, connect_timeout_.count());
      StopConnection(connection_.get());
      connection_.reset();
      return false;
    }

    net::post(*raw->ioc_, [this, raw]() {
      DoRead(raw);
      ScheduleHeartbeat(raw);
    });
    SPDLOG_INFO("SupabaseRealtimeFeed: connected to {}", raw->host_);
  }

  // Join every channel registered before the transport came up
  SendJoinAll();
  return true;
}

void SupabaseRealtimeFeed::Disconnect() {
  std::lock_guard<std::mutex> lock(connection_mutex_);
  if (!connection_) {
    return;
  }
  StopConnection(connection_.get());
  connection_.reset();
  SPDLOG_INFO("SupabaseRealtimeFeed: disconnected");
}

bool SupabaseRealtimeFeed::IsConnected() const {
  std::lock_guard<std::mutex> lock(connection_mutex_);
  return connection_ && connection_->connected_.load();
}

//==============================================================================
// Subscriptions
//==============================================================================

int SupabaseRealtimeFeed::Subscribe(const SubscriptionSpec& spec, PayloadCallback on_payload,
                                    FeedErrorCallback on_error) {
  int id = AddSubscription(spec, std::move(on_payload), std::move(on_error));
  std::string topic = TopicFor(id, spec);
  {
    std::lock_guard<std::mutex> lock(topics_mutex_);
    topics_[topic] = id;
  }

  std::string ref = NextRef();
  QueueWrite(BuildJoinMessage(topic, spec, schema_, api_key_, ref).dump());
  SPDLOG_DEBUG("SupabaseRealtimeFeed: subscription {} joining {} (ref {})", id, topic, ref);
  return id;
}

bool SupabaseRealtimeFeed::Unsubscribe(int subscription_id) {
  FeedSubscription removed;
  if (!RemoveSubscription(subscription_id, &removed)) {
    SPDLOG_WARN("SupabaseRealtimeFeed: unknown subscription {}", subscription_id);
    return false;
  }

  std::string topic = TopicFor(subscription_id, removed.spec);
  {
    std::lock_guard<std::mutex> lock(topics_mutex_);
    topics_.erase(topic);
  }
  QueueWrite(BuildLeaveMessage(topic, NextRef()).dump());
  SPDLOG_DEBUG("SupabaseRealtimeFeed: subscription {} left {}", subscription_id, topic);
  return true;
}

bool SupabaseRealtimeFeed::FindTopicSubscription(const std::string& topic, int* subscription_id) const {
  std::lock_guard<std::mutex> lock(topics_mutex_);
  auto it = topics_.find(topic);
  if (it == topics_.end()) {
    return false;
  }
  *subscription_id = it->second;
  return true;
}

void SupabaseRealtimeFeed::SendJoinAll() {
  for (const auto& subscription : SnapshotSubscriptions()) {
    std::string topic = TopicFor(subscription.id, subscription.spec);
    QueueWrite(BuildJoinMessage(topic, subscription.spec, schema_, api_key_, NextRef()).dump());
  }
}

//==============================================================================
// Protocol helpers
//==============================================================================

std::string SupabaseRealtimeFeed::TopicFor(int subscription_id, const SubscriptionSpec& spec) {
  return "realtime:" + spec.table + "-" + std::to_string(subscription_id);
}

nlohmann::json SupabaseRealtimeFeed::BuildJoinMessage(const std::string& topic,
                                                      const SubscriptionSpec& spec,
                                                      const std::string& schema,
                                                      const std::string& access_token,
                                                      const std::string& ref) {
  nlohmann::json change;
  change["event"] = ToString(spec.event_kind);
  change["schema"] = schema;
  change["table"] = spec.table;
  if (!spec.filter.empty()) {
    change["filter"] = spec.filter;
  }

  nlohmann::json msg;
  msg["topic"] = topic;
  msg["event"] = "phx_join";
  msg["ref"] = ref;
  msg["join_ref"] = ref;
  msg["payload"]["config"]["broadcast"]["self"] = false;
  msg["payload"]["config"]["presence"]["key"] = "";
  msg["payload"]["config"]["postgres_changes"] = nlohmann::json::array({change});
  if (!access_token.empty()) {
    msg["payload"]["access_token"] = access_token;
  }
  return msg;
}

nlohmann::json SupabaseRealtimeFeed::BuildLeaveMessage(const std::string& topic, const std::string& ref) {
  nlohmann::json msg;
  msg["topic"] = topic;
  msg["event"] = "phx_leave";
  msg["payload"] = nlohmann::json::object();
  msg["ref"] = ref;
  return msg;
}

nlohmann::json SupabaseRealtimeFeed::BuildHeartbeatMessage(const std::string& ref) {
  nlohmann::json msg;
  msg["topic"] = kPhoenixTopic;
  msg["event"] = "heartbeat";
  msg["payload"] = nlohmann::json::object();
  msg["ref"] = ref;
  return msg;
}

bool SupabaseRealtimeFeed::TranslatePostgresChange(const nlohmann::json& payload, nlohmann::json* out) {
  if (!payload.is_object() || !payload.contains("data") || !payload["data"].is_object()) {
    return false;
  }
  const auto& data = payload["data"];

  nlohmann::json raw;
  raw["eventType"] = data.contains("type") ? data["type"] : nlohmann::json();
  raw["table"] = data.contains("table") ? data["table"] : nlohmann::json();
  raw["new"] = data.contains("record") && !data["record"].is_null() ? data["record"]
                                                                    : nlohmann::json::object();
  raw["old"] = data.contains("old_record") && !data["old_record"].is_null() ? data["old_record"]
                                                                            : nlohmann::json::object();
  if (data.contains("commit_timestamp") && data["commit_timestamp"].is_string()) {
    raw["commit_timestamp"] = data["commit_timestamp"];
  }
  if (data.contains("schema")) {
    raw["schema"] = data["schema"];
  }
  *out = std::move(raw);
  return true;
}

//==============================================================================
// IO thread
//==============================================================================

void SupabaseRealtimeFeed::RunIO(RealtimeConnection* conn) {
  SPDLOG_DEBUG("SupabaseRealtimeFeed: IO thread started");
  try {
    // Short slices so shutdown is observed promptly
    while (conn->running_.load()) {
      conn->ioc_->run_for(std::chrono::milliseconds(200));
      if (conn->running_.load()) {
        conn->ioc_->restart();
      }
    }
  } catch (const std::exception& e) {
    SPDLOG_ERROR("SupabaseRealtimeFeed: IO thread exception: {}", e.what());
  }
  SPDLOG_DEBUG("SupabaseRealtimeFeed: IO thread exiting");
}

void SupabaseRealtimeFeed::QueueWrite(std::string message) {
  std::lock_guard<std::mutex> lock(connection_mutex_);
  if (!connection_ || !connection_->connected_.load()) {
    SPDLOG_TRACE("SupabaseRealtimeFeed: not connected, message deferred to next connect");
    return;
  }

  RealtimeConnection* conn = connection_.get();
  net::post(*conn->ioc_, [this, conn, message = std::move(message)]() mutable {
    conn->write_queue_.push_back(std::move(message));
    if (conn->write_queue_.size() == 1) {
      DoWrite(conn);
    }
  });
}

void SupabaseRealtimeFeed::DoWrite(RealtimeConnection* conn) {
  conn->ws_->text(true);
  conn->ws_->async_write(net::buffer(conn->write_queue_.front()),
      [this, conn](beast::error_code ec, std::size_t) {
        if (ec) {
          SPDLOG_WARN("SupabaseRealtimeFeed: write error: {}", ec.message());
          conn->write_queue_.clear();
          return;
        }
        conn->write_queue_.pop_front();
        if (!conn->write_queue_.empty()) {
          DoWrite(conn);
        }
      });
}

void SupabaseRealtimeFeed::DoRead(RealtimeConnection* conn) {
  if (!conn->running_.load() || !conn->ws_ || !conn->ws_->is_open()) {
    return;
  }
  conn->ws_->async_read(conn->read_buffer_,
      [this, conn](beast::error_code ec, std::size_t bytes_transferred) {
        OnRead(conn, ec, bytes_transferred);
      });
}

void SupabaseRealtimeFeed::OnRead(RealtimeConnection* conn, beast::error_code ec,
                                  std::size_t bytes_transferred) {
  if (!conn->running_.load()) {
    return;
  }

  if (ec) {
    bool was_connected = conn->connected_.exchange(false);
    if (conn->heartbeat_timer_) {
      conn->heartbeat_timer_->cancel();
    }
    if (ec == websocket::error::closed || ec == net::error::operation_aborted) {
      SPDLOG_INFO("SupabaseRealtimeFeed: websocket closed: {}", ec.message());
    } else {
      SPDLOG_ERROR("SupabaseRealtimeFeed: read error: {}", ec.message());
    }
    if (was_connected) {
      for (const auto& subscription : SnapshotSubscriptions()) {
        DeliverError(subscription.id, "realtime connection lost: " + ec.message());
      }
    }
    return;
  }

  std::string message = beast::buffers_to_string(conn->read_buffer_.data());
  conn->read_buffer_.consume(conn->read_buffer_.size());
  SPDLOG_TRACE("SupabaseRealtimeFeed: received {} bytes: [{}...]",
               bytes_transferred, message.substr(0, std::min<size_t>(100, message.size())));

  HandleMessage(message);
  DoRead(conn);
}

void SupabaseRealtimeFeed::ScheduleHeartbeat(RealtimeConnection* conn) {
  conn->heartbeat_timer_->expires_after(heartbeat_interval_);
  conn->heartbeat_timer_->async_wait([this, conn](beast::error_code ec) {
    if (ec || !conn->running_.load() || !conn->connected_.load()) {
      return;
    }
    conn->write_queue_.push_back(BuildHeartbeatMessage(NextRef()).dump());
    if (conn->write_queue_.size() == 1) {
      DoWrite(conn);
    }
    ScheduleHeartbeat(conn);
  });
}

//==============================================================================
// Message routing (IO thread)
//==============================================================================

void SupabaseRealtimeFeed::HandleMessage(const std::string& message) {
  nlohmann::json msg;
  try {
    msg = nlohmann::json::parse(message);
  } catch (const nlohmann::json::exception& e) {
    SPDLOG_WARN("SupabaseRealtimeFeed: JSON parse error: {}", e.what());
    return;
  }

  std::string topic = StringField(msg, "topic");
  std::string event = StringField(msg, "event");
  const nlohmann::json payload = msg.is_object() && msg.contains("payload") ? msg["payload"]
                                                                            : nlohmann::json();

  if (topic == kPhoenixTopic) {
    SPDLOG_TRACE("SupabaseRealtimeFeed: heartbeat reply");
    return;
  }

  int subscription_id = -1;
  if (!FindTopicSubscription(topic, &subscription_id)) {
    SPDLOG_DEBUG("SupabaseRealtimeFeed: {} for unknown topic {}", event, topic);
    return;
  }

  if (event == "postgres_changes") {
    nlohmann::json raw;
    if (!TranslatePostgresChange(payload, &raw)) {
      // Forward unchanged; the pool reports it as malformed
      raw = payload;
    }
    DeliverPayload(subscription_id, std::move(raw));
  } else if (event == "phx_reply" || event == "system") {
    std::string status = StringField(payload, "status");
    if (status == "error") {
      std::string reason = payload.contains("response") ? payload["response"].dump()
                                                         : StringField(payload, "message");
      DeliverError(subscription_id, event + " error on " + topic + ": " + reason);
    } else {
      SPDLOG_DEBUG("SupabaseRealtimeFeed: {} {} on {}", event, status, topic);
    }
  } else if (event == "phx_error") {
    DeliverError(subscription_id, "channel error on " + topic);
  } else if (event == "phx_close") {
    DeliverError(subscription_id, "channel closed: " + topic);
  } else {
    SPDLOG_TRACE("SupabaseRealtimeFeed: ignoring {} on {}", event, topic);
  }
}

void SupabaseRealtimeFeed::DeliverPayload(int subscription_id, nlohmann::json payload) {
  scheduler_.Post([this, alive = alive_, subscription_id, payload = std::move(payload)]() {
    if (!alive->load()) {
      return;
    }
    FeedSubscription subscription;
    if (FindSubscription(subscription_id, &subscription)) {
      NotifyPayload(subscription, payload);
    }
  });
}

void SupabaseRealtimeFeed::DeliverError(int subscription_id, std::string error) {
  scheduler_.Post([this, alive = alive_, subscription_id, error = std::move(error)]() {
    if (!alive->load()) {
      return;
    }
    FeedSubscription subscription;
    if (FindSubscription(subscription_id, &subscription)) {
      NotifyError(subscription, error);
    }
  });
}

}  // namespace realtime
}  // namespace quell
