#pragma once

#include "engine/cache/remote_cache_client.hpp"
#include "engine/resilience/retry_executor.hpp"
#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace quell {
namespace cache {

/**
 * @brief Remote cache operations that never throw
 *
 * Every call runs through the RetryExecutor (and so through the circuit
 * breaker). Values are stored as JSON text. When no client is configured,
 * or the circuit is open, or all attempts fail, the call degrades to a
 * miss / false / 0.
 */
class RemoteCache {
 public:
  // A batch step issued against the client
  using BatchOperation = std::function<std::future<std::string>(RemoteCacheClient&)>;

  // client may be nullptr (memory-only operation)
  RemoteCache(RemoteCacheClient* client, resilience::RetryExecutor& executor);
  ~RemoteCache() = default;

  // Non-copyable, non-movable
  RemoteCache(const RemoteCache&) = delete;
  RemoteCache& operator=(const RemoteCache&) = delete;

  bool IsAvailable() const { return client_ != nullptr; }

  // nullopt on miss, failure, open circuit or unparsable value
  std::optional<nlohmann::json> Get(const std::string& key);

  bool Set(const std::string& key, const nlohmann::json& value, std::chrono::seconds ttl);

  // Number of keys removed, 0 on failure
  int64_t Del(const std::vector<std::string>& keys);

  // Runs each step as its own BATCH operation, in order
  std::vector<std::optional<std::string>> Batch(const std::vector<BatchOperation>& operations);

  // PING answered with PONG under the health-check timeout
  bool CheckHealth();

 private:
  RemoteCacheClient* client_;
  resilience::RetryExecutor& executor_;
};

}  // namespace cache
}  // namespace quell
