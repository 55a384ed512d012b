#include "request_deduplicator.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace quell {
namespace cache {

namespace {

std::shared_future<Value> ReadyFuture(const Value& value) {
  std::promise<Value> promise;
  promise.set_value(value);
  return promise.get_future().share();
}

bool HasPrefix(const std::string& key, const std::string& prefix) {
  return key.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

RequestDeduplicator::RequestDeduplicator(std::chrono::milliseconds default_ttl,
                                         std::chrono::milliseconds request_timeout,
                                         engine::common::TimeSource time_source)
    : default_ttl_(default_ttl),
      request_timeout_(request_timeout),
      now_(time_source ? std::move(time_source)
                       : engine::common::TimeSource([] { return engine::common::SteadyClock::now(); })) {
  if (default_ttl_.count() < 0 || request_timeout_.count() <= 0) {
    throw std::invalid_argument("RequestDeduplicator ttl must be >= 0 and timeout > 0");
  }
}

std::shared_future<Value> RequestDeduplicator::Dedupe(const std::string& key, const Factory& factory,
                                                      const DedupeOptions& options) {
  std::promise<Value> promise;
  std::shared_future<Value> shared;
  uint64_t generation;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = now_();
    EvictStalePendingLocked(now);

    if (!options.force_refresh) {
      auto cached = cache_.find(key);
      if (cached != cache_.end()) {
        if (cached->second.IsFresh(now)) {
          SPDLOG_TRACE("RequestDeduplicator: cache hit {}", key);
          return ReadyFuture(cached->second.value);
        }
        cache_.erase(cached);
      }
    }

    auto in_flight = pending_.find(key);
    if (in_flight != pending_.end()) {
      SPDLOG_TRACE("RequestDeduplicator: joining in-flight request {}", key);
      return in_flight->second.future;
    }

    generation = next_generation_++;
    shared = promise.get_future().share();
    pending_[key] = PendingRequest{shared, now, options.timeout.value_or(request_timeout_), generation};
  }

  SPDLOG_TRACE("RequestDeduplicator: fetching {} (generation {})", key, generation);
  try {
    Value value = factory();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pending_.find(key);
      // An evicted or invalidated request still answers its waiters but is not cached
      if (it != pending_.end() && it->second.generation == generation) {
        pending_.erase(it);
        cache_[key] = CacheEntry{value, now_(), options.ttl.value_or(default_ttl_)};
      }
    }
    promise.set_value(std::move(value));
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pending_.find(key);
      if (it != pending_.end() && it->second.generation == generation) {
        pending_.erase(it);
      }
    }
    // Forwarded to every waiter through the shared future
    promise.set_exception(std::current_exception());
  }
  return shared;
}

Value RequestDeduplicator::Get(const std::string& key, const Factory& factory,
                               const DedupeOptions& options) {
  return Dedupe(key, factory, options).get();
}

bool RequestDeduplicator::Peek(const std::string& key, Value* out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.find(key);
  if (it == cache_.end() || !it->second.IsFresh(now_())) {
    return false;
  }
  *out = it->second.value;
  return true;
}

void RequestDeduplicator::Invalidate(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.erase(key);
  pending_.erase(key);
}

size_t RequestDeduplicator::InvalidatePrefix(const std::string& prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t removed = 0;
  for (auto it = cache_.begin(); it != cache_.end();) {
    if (HasPrefix(it->first, prefix)) {
      it = cache_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (HasPrefix(it->first, prefix)) {
      it = pending_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  SPDLOG_DEBUG("RequestDeduplicator: invalidated {} entries with prefix {}", removed, prefix);
  return removed;
}

void RequestDeduplicator::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.clear();
  pending_.clear();
}

size_t RequestDeduplicator::SweepExpired() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = now_();
  size_t removed = EvictStalePendingLocked(now);
  for (auto it = cache_.begin(); it != cache_.end();) {
    if (!it->second.IsFresh(now)) {
      it = cache_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    SPDLOG_DEBUG("RequestDeduplicator: swept {} expired entries", removed);
  }
  return removed;
}

size_t RequestDeduplicator::GetPendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

size_t RequestDeduplicator::GetCacheSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

size_t RequestDeduplicator::EvictStalePendingLocked(engine::common::SteadyClock::time_point now) {
  size_t evicted = 0;
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (now - it->second.created_at > it->second.timeout) {
      SPDLOG_WARN("RequestDeduplicator: evicting stuck request {} after {}ms",
                  it->first, it->second.timeout.count());
      it = pending_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  return evicted;
}

}  // namespace cache
}  // namespace quell
