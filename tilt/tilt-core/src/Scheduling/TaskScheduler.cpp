// Ticket: 0004_flip_controller

#include "tilt-core/src/Scheduling/TaskScheduler.hpp"

#include <algorithm>
#include <stdexcept>

namespace tilt_core
{

TaskScheduler::Handle TaskScheduler::schedule(std::chrono::milliseconds delay,
                                              Task task)
{
  if (!task)
  {
    throw std::invalid_argument("TaskScheduler::schedule: empty task");
  }

  const Handle handle = nextHandle_++;
  const auto dueAt = now_ + std::max(delay, std::chrono::milliseconds{0});
  tasks_.emplace(Key{dueAt, handle}, std::move(task));
  return handle;
}

bool TaskScheduler::cancel(Handle handle)
{
  auto it = std::find_if(tasks_.begin(),
                         tasks_.end(),
                         [handle](const auto& entry)
                         { return entry.first.second == handle; });
  if (it == tasks_.end())
  {
    return false;
  }
  tasks_.erase(it);
  return true;
}

void TaskScheduler::cancelAll()
{
  tasks_.clear();
}

void TaskScheduler::advance(std::chrono::milliseconds dt)
{
  now_ += std::max(dt, std::chrono::milliseconds{0});

  // Re-examine the front after every task: the task may have changed the map
  while (!tasks_.empty() && tasks_.begin()->first.first <= now_)
  {
    auto node = tasks_.extract(tasks_.begin());
    node.mapped()();
  }
}

bool TaskScheduler::isPending(Handle handle) const
{
  return std::any_of(tasks_.begin(),
                     tasks_.end(),
                     [handle](const auto& entry)
                     { return entry.first.second == handle; });
}

}  // namespace tilt_core
