#include "upstash_rest_client.hpp"
#include "engine/common/config_manager.hpp"
#include "engine/common/util.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <stdexcept>

namespace quell {
namespace cache {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

UpstashRestClient::UpstashRestClient(const engine::common::ConfigManager& config)
    : worker_("upstash") {
  token_ = config.GetString("cache.upstash.token", "");
  if (token_.empty()) {
    const char* env = std::getenv("QUELL_UPSTASH_TOKEN");
    if (env) {
      token_ = env;
    }
  }
  request_timeout_ = config.GetMilliseconds("cache.upstash.request_timeout_ms", kDefaultRequestTimeout);
  Configure(config.GetString("cache.upstash.url", ""));
  worker_.Start();
}

UpstashRestClient::UpstashRestClient(std::string base_url, std::string token,
                                     std::chrono::milliseconds request_timeout)
    : token_(std::move(token)),
      request_timeout_(request_timeout),
      worker_("upstash") {
  Configure(base_url);
  worker_.Start();
}

UpstashRestClient::~UpstashRestClient() {
  worker_.Stop();
}

void UpstashRestClient::Configure(const std::string& base_url) {
  if (base_url.empty()) {
    SPDLOG_WARN("UpstashRestClient: no URL configured, every call will fail");
    return;
  }
  auto parsed = engine::common::ParseUrl(base_url, "https");
  if (parsed.scheme != "https") {
    SPDLOG_ERROR("UpstashRestClient: only https:// URLs are supported, got {}", base_url);
    return;
  }
  host_ = parsed.host;
  port_ = parsed.port;
  path_ = parsed.path;
  SPDLOG_INFO("UpstashRestClient initialized - host: {}, timeout: {}ms, token set: {}",
              host_, request_timeout_.count(), !token_.empty());
}

//==============================================================================
// Commands
//==============================================================================

nlohmann::json UpstashRestClient::BuildSetCommand(const std::string& key, const std::string& value,
                                                  std::chrono::seconds ttl) {
  nlohmann::json command = nlohmann::json::array({"SET", key, value});
  if (ttl.count() > 0) {
    command.push_back("EX");
    command.push_back(ttl.count());
  }
  return command;
}

nlohmann::json UpstashRestClient::ParseReply(const std::string& body) {
  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(body);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("invalid Upstash reply: ") + e.what());
  }
  if (!reply.is_object()) {
    throw std::runtime_error("invalid Upstash reply: not an object");
  }
  if (reply.contains("error")) {
    throw std::runtime_error("Upstash error: " + reply["error"].dump());
  }
  if (!reply.contains("result")) {
    throw std::runtime_error("invalid Upstash reply: missing result");
  }
  return reply["result"];
}

std::future<std::optional<std::string>> UpstashRestClient::Get(const std::string& key) {
  return Submit<std::optional<std::string>>(
      nlohmann::json::array({"GET", key}),
      [](const nlohmann::json& result) -> std::optional<std::string> {
        if (result.is_null()) {
          return std::nullopt;
        }
        return result.is_string() ? result.get<std::string>() : result.dump();
      });
}

std::future<bool> UpstashRestClient::Set(const std::string& key, const std::string& value,
                                         std::chrono::seconds ttl) {
  return Submit<bool>(BuildSetCommand(key, value, ttl), [](const nlohmann::json& result) {
    return result.is_string() && result.get<std::string>() == "OK";
  });
}

std::future<int64_t> UpstashRestClient::Del(const std::vector<std::string>& keys) {
  nlohmann::json command = nlohmann::json::array({"DEL"});
  for (const auto& key : keys) {
    command.push_back(key);
  }
  return Submit<int64_t>(std::move(command), [](const nlohmann::json& result) -> int64_t {
    return result.is_number_integer() ? result.get<int64_t>() : 0;
  });
}

std::future<std::string> UpstashRestClient::Ping() {
  return Submit<std::string>(nlohmann::json::array({"PING"}), [](const nlohmann::json& result) {
    return result.is_string() ? result.get<std::string>() : result.dump();
  });
}

template <typename T>
std::future<T> UpstashRestClient::Submit(nlohmann::json command,
                                         std::function<T(const nlohmann::json&)> convert) {
  auto promise = std::make_shared<std::promise<T>>();
  std::future<T> future = promise->get_future();

  if (!IsConfigured()) {
    promise->set_exception(std::make_exception_ptr(
        std::runtime_error("Upstash client is not configured")));
    return future;
  }

  const auto deadline = std::chrono::steady_clock::now() + request_timeout_;
  worker_.Post([this, promise, deadline, command = std::move(command), convert = std::move(convert)]() {
    try {
      if (std::chrono::steady_clock::now() >= deadline) {
        throw std::runtime_error("request expired before it was sent");
      }
      promise->set_value(convert(Execute(command, deadline)));
    } catch (const std::exception& e) {
      SPDLOG_DEBUG("UpstashRestClient: {} failed: {}", command.empty() ? "" : command[0].dump(), e.what());
      promise->set_exception(std::current_exception());
    }
  });
  return future;
}

//==============================================================================
// Transport (worker thread)
//==============================================================================

namespace {

constexpr std::chrono::milliseconds kShutdownGrace{200};

// Runs one asynchronous step to completion so the stream deadline applies
template <typename Start>
void RunStep(net::io_context& ioc, const char* what, Start start) {
  beast::error_code result;
  start([&result](beast::error_code ec, auto&&...) { result = ec; });
  ioc.restart();
  ioc.run();
  if (result) {
    throw beast::system_error(result, what);
  }
}

}  // namespace

nlohmann::json UpstashRestClient::Execute(const nlohmann::json& command,
                                          std::chrono::steady_clock::time_point deadline) {
  ssl::context ctx(ssl::context::tlsv12_client);
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(ssl::verify_peer);
  ctx.set_verify_callback(ssl::host_name_verification(host_));

  net::io_context ioc;
  tcp::resolver resolver(ioc);
  tcp::resolver::results_type results;
  net::steady_timer resolve_timer(ioc);
  resolve_timer.expires_at(deadline);
  resolve_timer.async_wait([&resolver](beast::error_code ec) {
    if (!ec) {
      resolver.cancel();
    }
  });
  RunStep(ioc, "resolve", [&](auto handler) {
    resolver.async_resolve(host_, port_,
                           [&results, &resolve_timer, handler = std::move(handler)](
                               beast::error_code ec, tcp::resolver::results_type found) mutable {
                             resolve_timer.cancel();
                             results = std::move(found);
                             handler(ec);
                           });
  });

  ssl::stream<beast::tcp_stream> stream(ioc, ctx);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
    throw std::runtime_error("failed to set SNI host " + host_);
  }

  beast::get_lowest_layer(stream).expires_at(deadline);

  RunStep(ioc, "connect", [&](auto handler) {
    beast::get_lowest_layer(stream).async_connect(results, std::move(handler));
  });
  RunStep(ioc, "TLS handshake", [&](auto handler) {
    stream.async_handshake(ssl::stream_base::client, std::move(handler));
  });

  http::request<http::string_body> req{http::verb::post, path_, 11};
  req.set(http::field::host, host_);
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req.set(http::field::authorization, "Bearer " + token_);
  req.set(http::field::content_type, "application/json");
  req.body() = command.dump();
  req.prepare_payload();

  RunStep(ioc, "write", [&](auto handler) {
    http::async_write(stream, req, std::move(handler));
  });

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  RunStep(ioc, "read", [&](auto handler) {
    http::async_read(stream, buffer, res, std::move(handler));
  });

  // Best-effort TLS shutdown; "stream truncated" and "not connected" are harmless
  beast::get_lowest_layer(stream).expires_at(
      std::min(deadline, std::chrono::steady_clock::now() + kShutdownGrace));
  beast::error_code shutdown_ec;
  stream.async_shutdown([&shutdown_ec](beast::error_code ec) { shutdown_ec = ec; });
  ioc.restart();
  ioc.run();
  if (shutdown_ec && shutdown_ec != beast::errc::not_connected &&
      shutdown_ec != ssl::error::stream_truncated) {
    SPDLOG_DEBUG("UpstashRestClient: shutdown warning: {}", shutdown_ec.message());
  }

  if (res.result() != http::status::ok) {
    // Upstash reports command errors in the body with a 400 status
    if (res.result() == http::status::bad_request) {
      return ParseReply(res.body());
    }
    throw std::runtime_error("Upstash HTTP " + std::to_string(static_cast<int>(res.result())) +
                             ": " + res.body());
  }
  return ParseReply(res.body());
}

}  // namespace cache
}  // namespace quell
