#include "remote_cache.hpp"
#include <spdlog/spdlog.h>

namespace quell {
namespace cache {

using resilience::OperationKind;

RemoteCache::RemoteCache(RemoteCacheClient* client, resilience::RetryExecutor& executor)
    : client_(client),
      executor_(executor) {
}

std::optional<nlohmann::json> RemoteCache::Get(const std::string& key) {
  if (!client_) {
    return std::nullopt;
  }

  auto raw = executor_.Execute<std::optional<std::string>>(
      [this, &key]() { return client_->Get(key); }, OperationKind::GET);
  if (!raw || !*raw) {
    return std::nullopt;
  }

  try {
    return nlohmann::json::parse(**raw);
  } catch (const nlohmann::json::exception& e) {
    SPDLOG_WARN("RemoteCache: dropping unparsable value for {}: {}", key, e.what());
    return std::nullopt;
  }
}

bool RemoteCache::Set(const std::string& key, const nlohmann::json& value, std::chrono::seconds ttl) {
  if (!client_) {
    return false;
  }
  std::string text = value.dump();
  auto result = executor_.Execute<bool>(
      [this, &key, &text, ttl]() { return client_->Set(key, text, ttl); }, OperationKind::SET);
  return result.value_or(false);
}

int64_t RemoteCache::Del(const std::vector<std::string>& keys) {
  if (!client_ || keys.empty()) {
    return 0;
  }
  auto result = executor_.Execute<int64_t>(
      [this, &keys]() { return client_->Del(keys); }, OperationKind::DEL);
  return result.value_or(0);
}

std::vector<std::optional<std::string>> RemoteCache::Batch(const std::vector<BatchOperation>& operations) {
  std::vector<std::optional<std::string>> results;
  results.reserve(operations.size());
  for (const auto& operation : operations) {
    if (!client_) {
      results.emplace_back(std::nullopt);
      continue;
    }
    results.push_back(executor_.Execute<std::string>(
        [this, &operation]() { return operation(*client_); }, OperationKind::BATCH));
  }
  return results;
}

bool RemoteCache::CheckHealth() {
  if (!client_) {
    SPDLOG_DEBUG("RemoteCache: no client configured for health check");
    return false;
  }
  auto reply = executor_.Execute<std::string>(
      [this]() { return client_->Ping(); }, OperationKind::HEALTH_CHECK);
  bool healthy = reply && *reply == "PONG";
  if (!healthy) {
    SPDLOG_WARN("RemoteCache: health check failed (circuit {})",
                resilience::ToString(executor_.GetCircuitBreaker().GetState()));
  }
  return healthy;
}

}  // namespace cache
}  // namespace quell
