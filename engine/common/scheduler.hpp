#pragma once

#include <chrono>
#include <functional>

namespace quell {
namespace engine {
namespace common {

using SteadyClock = std::chrono::steady_clock;

// Source of "now" for components that measure ages and windows
using TimeSource = std::function<SteadyClock::time_point()>;

/**
 * @brief Timer/clock service shared by every component
 *
 * Delayed and periodic tasks return an id that can be cancelled. A cancelled
 * task never runs, even when its deadline already passed. Implementations run
 * all tasks on one logical thread.
 */
class Scheduler {
 public:
  virtual ~Scheduler() = default;

  /** @brief Current time on the scheduler's clock */
  virtual SteadyClock::time_point Now() const = 0;

  /** @brief Run task as soon as possible */
  virtual void Post(std::function<void()> task) = 0;

  /** @brief Run task once after delay, returns task ID (-1 if not accepted) */
  virtual int PostDelayed(std::function<void()> task, std::chrono::milliseconds delay) = 0;

  /** @brief Cancel a delayed task; unknown or finished IDs are ignored */
  virtual void CancelDelayed(int task_id) = 0;

  /** @brief Run task every interval, returns task ID (-1 if not accepted) */
  virtual int SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval) = 0;

  /** @brief Cancel periodic task by ID */
  virtual void CancelPeriodic(int task_id) = 0;

  /** @brief Bind Now() as a TimeSource */
  TimeSource AsTimeSource() const {
    return [this]() { return Now(); };
  }
};

}  // namespace common
}  // namespace engine
}  // namespace quell
