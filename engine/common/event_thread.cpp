#include "event_thread.hpp"
#include <spdlog/spdlog.h>

namespace quell {
namespace engine {
namespace common {

EventThread::EventThread(std::string name) : name_(std::move(name)) {
}

EventThread::~EventThread() {
  if (IsLoopThread()) {
    // Nothing can join the thread we are running on
    SPDLOG_ERROR("EventThread {} destroyed from its own loop", name_);
    running_ = false;
    if (thread_.joinable()) {
      thread_.detach();
    }
    return;
  }
  Stop();
}

//==============================================================================
// Thread control
//==============================================================================

void EventThread::Start() {
  if (running_.exchange(true)) {
    return;
  }
  if (thread_.joinable()) {
    if (IsLoopThread()) {
      SPDLOG_ERROR("EventThread {} cannot be restarted from its own loop", name_);
      running_ = false;
      return;
    }
    // The loop stopped itself earlier and was never joined
    Join();
  }

  std::promise<void> exited;
  loop_exited_ = exited.get_future();
  thread_ = std::thread([this, exited = std::move(exited)]() mutable {
    loop_id_ = std::this_thread::get_id();
    Loop();
    exited.set_value();
  });
  SPDLOG_DEBUG("EventThread {} started", name_);
}

bool EventThread::Stop(std::chrono::milliseconds timeout) {
  running_ = false;
  cv_.notify_all();

  if (IsLoopThread()) {
    // The loop ends after this pass; the next Stop() or the destructor joins it
    return true;
  }
  if (!thread_.joinable()) {
    return true;
  }

  bool in_time = true;
  if (timeout.count() > 0 && loop_exited_.wait_for(timeout) != std::future_status::ready) {
    SPDLOG_WARN("EventThread {} still busy {}ms after stop, waiting for it", name_, timeout.count());
    in_time = false;
  }
  Join();
  SPDLOG_DEBUG("EventThread {} stopped", name_);
  return in_time;
}

void EventThread::Join() {
  thread_.join();
  loop_id_ = std::thread::id();
  std::lock_guard<std::mutex> lock(mutex_);
  timers_ = decltype(timers_)();
  live_timers_.clear();
}

//==============================================================================
// Scheduler
//==============================================================================

void EventThread::Post(std::function<void()> task) {
  if (!running_.load()) {
    SPDLOG_TRACE("EventThread {}: task posted while stopped, dropped", name_);
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    posted_.push_back(std::move(task));
  }
  cv_.notify_one();
}

int EventThread::PostDelayed(std::function<void()> task, std::chrono::milliseconds delay) {
  return AddTimer(std::move(task), delay, std::chrono::milliseconds(0));
}

void EventThread::CancelDelayed(int task_id) {
  CancelTimer(task_id);
}

int EventThread::SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval) {
  if (interval.count() <= 0) {
    SPDLOG_ERROR("EventThread {}: periodic interval must be positive, got {}ms", name_, interval.count());
    return -1;
  }
  return AddTimer(std::move(task), interval, interval);
}

void EventThread::CancelPeriodic(int task_id) {
  CancelTimer(task_id);
}

size_t EventThread::GetQueueDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return posted_.size() + live_timers_.size();
}

int EventThread::AddTimer(Task task, std::chrono::milliseconds delay, std::chrono::milliseconds interval) {
  if (!running_.load()) {
    return -1;
  }

  int id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_task_id_++;
    live_timers_[id] = LiveTimer{std::make_shared<Task>(std::move(task)), interval};
    timers_.push(TimerEntry{SteadyClock::now() + delay, next_seq_++, id});
  }
  cv_.notify_one();
  return id;
}

void EventThread::CancelTimer(int task_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  live_timers_.erase(task_id);
}

//==============================================================================
// Loop
//==============================================================================

void EventThread::Loop() {
  while (running_.load()) {
    DrainPosted();
    RunDueTimers();
    WaitForWork();
  }
  DrainPosted();
}

void EventThread::DrainPosted() {
  std::deque<Task> batch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    batch.swap(posted_);
  }
  for (const auto& task : batch) {
    RunGuarded(task, "posted");
  }
}

void EventThread::RunDueTimers() {
  const auto now = SteadyClock::now();
  while (true) {
    std::shared_ptr<Task> task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (timers_.empty() || timers_.top().due > now) {
        return;
      }
      TimerEntry entry = timers_.top();
      timers_.pop();

      auto it = live_timers_.find(entry.id);
      if (it == live_timers_.end()) {
        continue;  // Cancelled
      }
      task = it->second.task;
      if (it->second.interval.count() > 0) {
        timers_.push(TimerEntry{now + it->second.interval, next_seq_++, entry.id});
      } else {
        live_timers_.erase(it);
      }
    }
    RunGuarded(*task, "timer");
  }
}

void EventThread::WaitForWork() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!posted_.empty() || !running_.load()) {
    return;
  }
  if (timers_.empty()) {
    cv_.wait(lock, [this] { return !running_.load() || !posted_.empty() || !timers_.empty(); });
    return;
  }
  const auto due = timers_.top().due;
  cv_.wait_until(lock, due, [this, due] {
    return !running_.load() || !posted_.empty() || timers_.top().due < due;
  });
}

void EventThread::RunGuarded(const Task& task, const char* kind) {
  try {
    task();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("EventThread {}: {} task threw: {}", name_, kind, e.what());
  }
}

}  // namespace common
}  // namespace engine
}  // namespace quell
