// Ticket: 0004_flip_controller

#ifndef TILT_CORE_TASK_SCHEDULER_HPP
#define TILT_CORE_TASK_SCHEDULER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>

namespace tilt_core
{

/**
 * @brief Frame-driven one-shot timers, cancelable by handle
 *
 * Time only moves when advance() is called, so the owner's frame tick is the
 * single clock. Due tasks run in due-time order; tasks due at the same
 * instant run in the order they were scheduled. A task may schedule or cancel
 * other tasks while running; a task scheduled with zero delay from inside
 * advance() runs within the same advance() call.
 *
 * Thread safety: Not thread-safe
 */
class TaskScheduler
{
public:
  using Task = std::function<void()>;
  using Handle = uint64_t;

  static constexpr Handle kInvalidHandle = 0;

  TaskScheduler() = default;

  /**
   * @brief Schedule a task to run once after a delay
   * @param delay Relative to the current scheduler time; negative delays are
   *        treated as zero
   * @throws std::invalid_argument if task is empty
   */
  Handle schedule(std::chrono::milliseconds delay, Task task);

  /// @return true if a pending task was removed
  bool cancel(Handle handle);

  void cancelAll();

  /// Move time forward by dt and run every task that became due
  void advance(std::chrono::milliseconds dt);

  [[nodiscard]] bool isPending(Handle handle) const;

  [[nodiscard]] size_t pendingCount() const
  {
    return tasks_.size();
  }

  [[nodiscard]] std::chrono::milliseconds now() const
  {
    return now_;
  }

  TaskScheduler(const TaskScheduler&) = delete;
  TaskScheduler& operator=(const TaskScheduler&) = delete;
  TaskScheduler(TaskScheduler&&) noexcept = default;
  TaskScheduler& operator=(TaskScheduler&&) noexcept = default;
  ~TaskScheduler() = default;

private:
  // (due time, handle); handles grow monotonically so ties keep FIFO order
  using Key = std::pair<std::chrono::milliseconds, Handle>;

  std::map<Key, Task> tasks_;
  std::chrono::milliseconds now_{0};
  Handle nextHandle_{1};
};

}  // namespace tilt_core

#endif  // TILT_CORE_TASK_SCHEDULER_HPP
