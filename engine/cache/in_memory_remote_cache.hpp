#pragma once

#include "engine/cache/remote_cache_client.hpp"
#include "engine/common/scheduler.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace quell {
namespace cache {

/**
 * @brief In-process RemoteCacheClient with fault injection
 *
 * Completes every call inline. FailNext(n) makes the next n calls fail with
 * an exception; SetHang(true) leaves futures unsatisfied until SetHang(false)
 * releases them, which exercises the executor's timeout path.
 */
class InMemoryRemoteCache : public RemoteCacheClient {
 public:
  explicit InMemoryRemoteCache(engine::common::TimeSource time_source = nullptr);
  ~InMemoryRemoteCache() override;

  std::future<std::optional<std::string>> Get(const std::string& key) override;
  std::future<bool> Set(const std::string& key, const std::string& value,
                        std::chrono::seconds ttl) override;
  std::future<int64_t> Del(const std::vector<std::string>& keys) override;
  std::future<std::string> Ping() override;
  std::string GetName() const override { return "in_memory"; }

  // Fault injection
  void FailNext(int count) { fail_next_ = count; }
  void SetHang(bool hang);

  // Introspection
  size_t GetCallCount() const { return call_count_.load(); }
  size_t GetSize() const;
  bool Contains(const std::string& key) const;

 private:
  struct Entry {
    std::string value;
    engine::common::SteadyClock::time_point expires_at;
  };

  template <typename T>
  std::future<T> Complete(std::function<T()> body);

  // Returns true when this call should fail
  bool ConsumeFailure();

  engine::common::TimeSource now_;
  std::atomic<int> fail_next_{0};
  std::atomic<size_t> call_count_{0};

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
  bool hang_ = false;
  std::vector<std::function<void()>> held_;  // Completions parked while hanging
};

}  // namespace cache
}  // namespace quell
