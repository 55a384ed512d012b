#pragma once

#include "engine/common/scheduler.hpp"
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace quell {
namespace cache {

using Value = nlohmann::json;

struct DedupeOptions {
  std::optional<std::chrono::milliseconds> ttl;      // Default: deduplicator's default TTL
  bool force_refresh = false;                         // Skip the cached value, still joins in-flight work
  std::optional<std::chrono::milliseconds> timeout;  // Default: deduplicator's request timeout
};

/**
 * @brief Single-flight request collapsing with a short-TTL result cache
 *
 * For a given key at most one factory call is in flight. Callers arriving
 * while it runs get the same shared future; callers arriving after it
 * finished get the cached value until its TTL passes. Failures are handed
 * to every waiter and never cached.
 *
 * The factory runs synchronously on the thread of the first caller, outside
 * the internal lock. A pending request older than its timeout is evicted
 * (lazily and by SweepExpired) so a stuck factory cannot pin the key.
 */
class RequestDeduplicator {
 public:
  using Factory = std::function<Value()>;

  explicit RequestDeduplicator(std::chrono::milliseconds default_ttl = std::chrono::milliseconds(5000),
                               std::chrono::milliseconds request_timeout = std::chrono::milliseconds(30000),
                               engine::common::TimeSource time_source = nullptr);
  ~RequestDeduplicator() = default;

  // Non-copyable, non-movable
  RequestDeduplicator(const RequestDeduplicator&) = delete;
  RequestDeduplicator& operator=(const RequestDeduplicator&) = delete;

  std::shared_future<Value> Dedupe(const std::string& key, const Factory& factory,
                                   const DedupeOptions& options = DedupeOptions());

  // Blocking convenience; rethrows the factory's exception
  Value Get(const std::string& key, const Factory& factory,
            const DedupeOptions& options = DedupeOptions());

  // Fresh cached value without triggering a fetch
  bool Peek(const std::string& key, Value* out) const;

  // Drops the cached value and forgets any in-flight request for key
  void Invalidate(const std::string& key);

  // Same for every key starting with prefix, returns number of keys touched
  size_t InvalidatePrefix(const std::string& prefix);

  void Clear();

  // Removes expired cache entries and timed-out pending requests
  size_t SweepExpired();

  size_t GetPendingCount() const;
  size_t GetCacheSize() const;

  std::chrono::milliseconds GetDefaultTtl() const { return default_ttl_; }

 private:
  struct PendingRequest {
    std::shared_future<Value> future;
    engine::common::SteadyClock::time_point created_at;
    std::chrono::milliseconds timeout;
    uint64_t generation;
  };

  struct CacheEntry {
    Value value;
    engine::common::SteadyClock::time_point stored_at;
    std::chrono::milliseconds ttl;

    bool IsFresh(engine::common::SteadyClock::time_point now) const {
      return now - stored_at < ttl;
    }
  };

  size_t EvictStalePendingLocked(engine::common::SteadyClock::time_point now);

  std::chrono::milliseconds default_ttl_;
  std::chrono::milliseconds request_timeout_;
  engine::common::TimeSource now_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, PendingRequest> pending_;
  std::unordered_map<std::string, CacheEntry> cache_;
  uint64_t next_generation_ = 1;
};

}  // namespace cache
}  // namespace quell
