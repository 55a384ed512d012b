#include "in_memory_remote_cache.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace quell {
namespace cache {

InMemoryRemoteCache::InMemoryRemoteCache(engine::common::TimeSource time_source)
    : now_(time_source ? std::move(time_source)
                       : engine::common::TimeSource([] { return engine::common::SteadyClock::now(); })) {
}

InMemoryRemoteCache::~InMemoryRemoteCache() {
  // Release anything still parked so no waiter sees a broken promise
  SetHang(false);
}

bool InMemoryRemoteCache::ConsumeFailure() {
  int remaining = fail_next_.load();
  while (remaining > 0) {
    if (fail_next_.compare_exchange_weak(remaining, remaining - 1)) {
      return true;
    }
  }
  return false;
}

template <typename T>
std::future<T> InMemoryRemoteCache::Complete(std::function<T()> body) {
  ++call_count_;
  auto promise = std::make_shared<std::promise<T>>();
  std::future<T> future = promise->get_future();
  bool fail = ConsumeFailure();

  std::function<void()> completion = [promise, body = std::move(body), fail]() {
    if (fail) {
      promise->set_exception(std::make_exception_ptr(
          std::runtime_error("injected remote cache failure")));
      return;
    }
    try {
      promise->set_value(body());
    } catch (const std::exception&) {
      promise->set_exception(std::current_exception());
    }
  };

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (hang_) {
      held_.push_back(std::move(completion));
      return future;
    }
  }
  completion();
  return future;
}

void InMemoryRemoteCache::SetHang(bool hang) {
  std::vector<std::function<void()>> released;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hang_ = hang;
    if (!hang) {
      released.swap(held_);
    }
  }
  for (auto& completion : released) {
    completion();
  }
}

std::future<std::optional<std::string>> InMemoryRemoteCache::Get(const std::string& key) {
  return Complete<std::optional<std::string>>([this, key]() -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    if (now_() >= it->second.expires_at) {
      entries_.erase(it);
      return std::nullopt;
    }
    return it->second.value;
  });
}

std::future<bool> InMemoryRemoteCache::Set(const std::string& key, const std::string& value,
                                           std::chrono::seconds ttl) {
  return Complete<bool>([this, key, value, ttl]() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = Entry{value, now_() + ttl};
    return true;
  });
}

std::future<int64_t> InMemoryRemoteCache::Del(const std::vector<std::string>& keys) {
  return Complete<int64_t>([this, keys]() {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t removed = 0;
    for (const auto& key : keys) {
      removed += static_cast<int64_t>(entries_.erase(key));
    }
    return removed;
  });
}

std::future<std::string> InMemoryRemoteCache::Ping() {
  return Complete<std::string>([]() { return std::string("PONG"); });
}

size_t InMemoryRemoteCache::GetSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

bool InMemoryRemoteCache::Contains(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  return it != entries_.end() && now_() < it->second.expires_at;
}

}  // namespace cache
}  // namespace quell
