#pragma once

#include "engine/cache/remote_cache_client.hpp"
#include "engine/common/event_thread.hpp"
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace quell {
namespace engine {
namespace common {
class ConfigManager;
}  // namespace common
}  // namespace engine

namespace cache {

/**
 * @brief Upstash Redis REST client
 *
 * Each command is POSTed as a JSON array (["SET", key, value, "EX", ttl])
 * to the database URL with a bearer token. Replies look like
 * {"result": ...} or {"error": "..."}; an error reply fails the future.
 *
 * Requests run one at a time on an internal worker thread, so callers only
 * ever wait on futures. Each request's deadline starts when it is submitted;
 * one still queued at its deadline fails without touching the network.
 *
 * Config (cache.upstash.*): url, token ($QUELL_UPSTASH_TOKEN when empty),
 * request_timeout_ms.
 */
class UpstashRestClient : public RemoteCacheClient {
 public:
  // Matches the executor's GET/SET/DEL timeout so an abandoned attempt frees
  // the worker before its retry needs it
  static constexpr std::chrono::milliseconds kDefaultRequestTimeout{4000};

  explicit UpstashRestClient(const engine::common::ConfigManager& config);
  UpstashRestClient(std::string base_url, std::string token,
                    std::chrono::milliseconds request_timeout = kDefaultRequestTimeout);
  ~UpstashRestClient() override;

  // Non-copyable, non-movable
  UpstashRestClient(const UpstashRestClient&) = delete;
  UpstashRestClient& operator=(const UpstashRestClient&) = delete;

  std::future<std::optional<std::string>> Get(const std::string& key) override;
  std::future<bool> Set(const std::string& key, const std::string& value,
                        std::chrono::seconds ttl) override;
  std::future<int64_t> Del(const std::vector<std::string>& keys) override;
  std::future<std::string> Ping() override;
  std::string GetName() const override { return "upstash"; }

  bool IsConfigured() const { return !host_.empty() && !token_.empty(); }
  std::chrono::milliseconds GetRequestTimeout() const { return request_timeout_; }

  // Command encoding (public for tests)
  static nlohmann::json BuildSetCommand(const std::string& key, const std::string& value,
                                        std::chrono::seconds ttl);

  // Extract "result", throwing std::runtime_error on {"error": ...} or bad JSON
  static nlohmann::json ParseReply(const std::string& body);

 private:
  void Configure(const std::string& base_url);

  // Blocking HTTPS POST of one command, returns the "result" node. Resolve,
  // connect, TLS and the exchange all share the deadline.
  nlohmann::json Execute(const nlohmann::json& command, std::chrono::steady_clock::time_point deadline);

  template <typename T>
  std::future<T> Submit(nlohmann::json command, std::function<T(const nlohmann::json&)> convert);

  std::string host_;
  std::string port_;
  std::string path_;
  std::string token_;
  std::chrono::milliseconds request_timeout_{kDefaultRequestTimeout};

  engine::common::EventThread worker_;
};

}  // namespace cache
}  // namespace quell
