#pragma once

#include "engine/common/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace quell {
namespace engine {
namespace common {

/**
 * @brief Scheduler backed by one dedicated thread
 *
 * Posted tasks run in FIFO order. Delayed and periodic tasks share one timer
 * heap; a timer whose id was cancelled is skipped when it comes due. A task
 * that throws is logged and the loop keeps going.
 *
 * Timers are only accepted while the thread runs. Stopping drains tasks
 * already posted and abandons pending timers.
 */
class EventThread : public Scheduler {
 public:
  explicit EventThread(std::string name = "event_thread");
  ~EventThread() override;

  // Non-copyable, non-movable (the loop captures this)
  EventThread(const EventThread&) = delete;
  EventThread& operator=(const EventThread&) = delete;

  void Start();

  /**
   * @brief Stop the loop and join it
   * @param timeout Zero waits indefinitely. Otherwise a warning is logged
   *                when the loop takes longer, and the call still joins.
   *
   * Called from one of the loop's own tasks it only ends the loop; the
   * thread is joined by a later Stop(), Start() or the destructor, which
   * must then run on another thread.
   * @return false when the timeout was exceeded
   */
  bool Stop(std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  bool IsRunning() const { return running_.load(); }
  bool IsLoopThread() const { return std::this_thread::get_id() == loop_id_.load(); }

  // Scheduler
  SteadyClock::time_point Now() const override { return SteadyClock::now(); }
  void Post(std::function<void()> task) override;
  int PostDelayed(std::function<void()> task, std::chrono::milliseconds delay) override;
  void CancelDelayed(int task_id) override;
  int SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval) override;
  void CancelPeriodic(int task_id) override;

  // Posted tasks not yet run plus live timers
  size_t GetQueueDepth() const;

  const std::string& GetName() const { return name_; }

 private:
  using Task = std::function<void()>;

  struct TimerEntry {
    SteadyClock::time_point due;
    uint64_t seq = 0;  // FIFO among equal deadlines
    int id = 0;

    bool operator>(const TimerEntry& other) const {
      return due != other.due ? due > other.due : seq > other.seq;
    }
  };

  struct LiveTimer {
    std::shared_ptr<Task> task;
    std::chrono::milliseconds interval{0};  // Zero for one-shot
  };

  int AddTimer(Task task, std::chrono::milliseconds delay, std::chrono::milliseconds interval);
  void CancelTimer(int task_id);

  void Loop();
  void Join();
  void DrainPosted();
  void RunDueTimers();
  void WaitForWork();
  void RunGuarded(const Task& task, const char* kind);

  std::string name_;
  std::atomic<bool> running_{false};
  std::atomic<std::thread::id> loop_id_{};
  std::thread thread_;
  std::future<void> loop_exited_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> posted_;
  std::priority_queue<TimerEntry, std::vector<TimerEntry>, std::greater<TimerEntry>> timers_;
  std::unordered_map<int, LiveTimer> live_timers_;  // Cancelling erases the entry
  int next_task_id_ = 1;
  uint64_t next_seq_ = 1;
};

}  // namespace common
}  // namespace engine
}  // namespace quell
