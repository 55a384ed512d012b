#pragma once

#include "engine/common/scheduler.hpp"
#include "engine/realtime/change_event.hpp"
#include "engine/realtime/subscription_spec.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace quell {
namespace aggregation {

/**
 * @brief Per-channel batching with pure debounce
 *
 * Each event appended to a channel restarts that channel's debounce timer.
 * When the queue reaches the tier's max batch size it is flushed at once.
 * A flush hands one event unwrapped or a ChangeBatch for several, in
 * arrival order.
 *
 * Queue and timer are cleared before the callback runs, so a throwing
 * callback loses only its own delivery. Timer tasks carry a sequence number;
 * a superseded or cancelled timer never flushes.
 */
class BatchEngine {
 public:
  using DeliveryCallback = std::function<void(const std::string& channel,
                                              const realtime::Delivery& delivery)>;

  explicit BatchEngine(engine::common::Scheduler& scheduler);
  ~BatchEngine();

  // Non-copyable, non-movable (timer tasks capture this)
  BatchEngine(const BatchEngine&) = delete;
  BatchEngine& operator=(const BatchEngine&) = delete;

  // Replaces an existing registration (its queue is dropped)
  // Throws std::invalid_argument for a zero max batch size
  void Register(const std::string& channel, const realtime::TierSettings& settings,
                DeliveryCallback callback);

  // Returns false for unregistered channels (event dropped)
  bool OnEvent(const std::string& channel, realtime::ChangeEvent event);

  // Deliver whatever is queued now; false when nothing was queued
  bool Flush(const std::string& channel);

  // Cancel timer, drop queue, forget callback
  void Remove(const std::string& channel);

  size_t GetPendingCount(const std::string& channel) const;
  bool IsRegistered(const std::string& channel) const;
  size_t GetChannelCount() const;

 private:
  struct ChannelState {
    realtime::TierSettings settings;
    DeliveryCallback callback;
    std::vector<realtime::ChangeEvent> queue;
    int timer_id = -1;
    uint64_t timer_seq = 0;  // Sequence of the live timer
  };

  void OnTimer(const std::string& channel, uint64_t timer_seq);
  void CancelTimerLocked(ChannelState& state);
  void Deliver(const std::string& channel, const DeliveryCallback& callback,
               std::vector<realtime::ChangeEvent> events);

  engine::common::Scheduler& scheduler_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, ChannelState> channels_;
  uint64_t next_timer_seq_ = 1;
};

}  // namespace aggregation
}  // namespace quell
