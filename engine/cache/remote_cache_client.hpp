#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace quell {
namespace cache {

/**
 * @brief Asynchronous key-value client for a remote cache (Redis-like)
 *
 * Every call returns immediately with a future satisfied by a promise the
 * client owns. Transport failures surface as exceptions on the future.
 */
class RemoteCacheClient {
 public:
  virtual ~RemoteCacheClient() = default;

  // nullopt on miss
  virtual std::future<std::optional<std::string>> Get(const std::string& key) = 0;

  // true when the server acknowledged with OK
  virtual std::future<bool> Set(const std::string& key, const std::string& value,
                                std::chrono::seconds ttl) = 0;

  // Number of keys removed
  virtual std::future<int64_t> Del(const std::vector<std::string>& keys) = 0;

  // "PONG" from a healthy server
  virtual std::future<std::string> Ping() = 0;

  virtual std::string GetName() const = 0;
};

}  // namespace cache
}  // namespace quell
