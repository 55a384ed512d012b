#include "batch_engine.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace quell {
namespace aggregation {

using realtime::ChangeBatch;
using realtime::ChangeEvent;
using realtime::Delivery;

BatchEngine::BatchEngine(engine::common::Scheduler& scheduler)
    : scheduler_(scheduler) {
}

BatchEngine::~BatchEngine() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [channel, state] : channels_) {
    CancelTimerLocked(state);
  }
  channels_.clear();
}

void BatchEngine::Register(const std::string& channel, const realtime::TierSettings& settings,
                           DeliveryCallback callback) {
  if (settings.max_batch_size == 0) {
    throw std::invalid_argument("BatchEngine: max_batch_size must be positive for channel " + channel);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = channels_.find(channel);
  if (it != channels_.end()) {
    SPDLOG_WARN("BatchEngine: re-registering channel {}, dropping {} queued events",
                channel, it->second.queue.size());
    CancelTimerLocked(it->second);
  }

  ChannelState& state = channels_[channel];
  state.settings = settings;
  state.callback = std::move(callback);
  state.queue.clear();
  state.queue.reserve(settings.max_batch_size);
  SPDLOG_DEBUG("BatchEngine: registered {} (debounce {}ms, max batch {})",
               channel, settings.debounce.count(), settings.max_batch_size);
}

bool BatchEngine::OnEvent(const std::string& channel, ChangeEvent event) {
  DeliveryCallback callback;
  std::vector<ChangeEvent> ready;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel);
    if (it == channels_.end()) {
      SPDLOG_DEBUG("BatchEngine: event for unregistered channel {} dropped", channel);
      return false;
    }

    ChannelState& state = it->second;
    state.queue.push_back(std::move(event));
    CancelTimerLocked(state);

    if (state.queue.size() >= state.settings.max_batch_size) {
      // Size threshold reached, flush now
      ready.swap(state.queue);
      callback = state.callback;
    } else {
      uint64_t seq = next_timer_seq_++;
      state.timer_seq = seq;
      state.timer_id = scheduler_.PostDelayed(
          [this, channel, seq]() { OnTimer(channel, seq); }, state.settings.debounce);
      if (state.timer_id < 0) {
        // Scheduler stopped; nothing would ever flush this queue
        SPDLOG_WARN("BatchEngine: scheduler rejected debounce timer for {}, flushing now", channel);
        state.timer_seq = 0;
        ready.swap(state.queue);
        callback = state.callback;
      } else {
        SPDLOG_TRACE("BatchEngine: {} queued {} events, flush in {}ms",
                     channel, state.queue.size(), state.settings.debounce.count());
      }
    }
  }

  if (!ready.empty()) {
    Deliver(channel, callback, std::move(ready));
  }
  return true;
}

bool BatchEngine::Flush(const std::string& channel) {
  DeliveryCallback callback;
  std::vector<ChangeEvent> ready;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel);
    if (it == channels_.end()) {
      return false;
    }
    CancelTimerLocked(it->second);
    if (it->second.queue.empty()) {
      return false;
    }
    ready.swap(it->second.queue);
    callback = it->second.callback;
  }

  Deliver(channel, callback, std::move(ready));
  return true;
}

void BatchEngine::Remove(const std::string& channel) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = channels_.find(channel);
  if (it == channels_.end()) {
    return;
  }
  CancelTimerLocked(it->second);
  if (!it->second.queue.empty()) {
    SPDLOG_DEBUG("BatchEngine: removing {} with {} undelivered events", channel, it->second.queue.size());
  }
  channels_.erase(it);
}

size_t BatchEngine::GetPendingCount(const std::string& channel) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = channels_.find(channel);
  return it == channels_.end() ? 0 : it->second.queue.size();
}

bool BatchEngine::IsRegistered(const std::string& channel) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return channels_.count(channel) > 0;
}

size_t BatchEngine::GetChannelCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return channels_.size();
}

void BatchEngine::OnTimer(const std::string& channel, uint64_t timer_seq) {
  DeliveryCallback callback;
  std::vector<ChangeEvent> ready;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel);
    if (it == channels_.end() || it->second.timer_seq != timer_seq || it->second.timer_id < 0) {
      SPDLOG_TRACE("BatchEngine: stale timer {} for {} ignored", timer_seq, channel);
      return;
    }
    it->second.timer_id = -1;
    it->second.timer_seq = 0;
    if (it->second.queue.empty()) {
      return;
    }
    ready.swap(it->second.queue);
    callback = it->second.callback;
  }

  Deliver(channel, callback, std::move(ready));
}

void BatchEngine::CancelTimerLocked(ChannelState& state) {
  if (state.timer_id >= 0) {
    scheduler_.CancelDelayed(state.timer_id);
  }
  state.timer_id = -1;
  state.timer_seq = 0;
}

void BatchEngine::Deliver(const std::string& channel, const DeliveryCallback& callback,
                          std::vector<ChangeEvent> events) {
  if (!callback) {
    return;
  }

  SPDLOG_DEBUG("BatchEngine: flushing {} events on {}", events.size(), channel);
  try {
    if (events.size() == 1) {
      callback(channel, Delivery(std::move(events.front())));
    } else {
      callback(channel, Delivery(ChangeBatch{std::move(events)}));
    }
  } catch (const std::exception& e) {
    SPDLOG_ERROR("BatchEngine: delivery callback for {} threw: {}", channel, e.what());
  }
}

}  // namespace aggregation
}  // namespace quell
