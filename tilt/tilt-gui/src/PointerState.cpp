// Ticket: 0011_preview_app

#include "tilt-gui/src/PointerState.hpp"

#include <algorithm>
#include <stdexcept>

namespace tilt_gui
{

PointerState::PointerState(std::chrono::milliseconds velocityWindow)
  : velocityWindow_{velocityWindow}
{
  if (velocityWindow_.count() <= 0)
  {
    throw std::invalid_argument{"PointerState: velocity window must be > 0"};
  }
}

void PointerState::press(const Eigen::Vector2d& position)
{
  pressed_ = true;
  pressTime_ = currentTime_;
  pressPosition_ = position;
  position_ = position;
  maxTravel_ = 0.0;
  samples_.clear();
  record(position);
}

void PointerState::move(const Eigen::Vector2d& position)
{
  if (!pressed_)
  {
    return;
  }
  position_ = position;
  maxTravel_ = std::max(maxTravel_, (position - pressPosition_).norm());
  record(position);
}

void PointerState::release(const Eigen::Vector2d& position)
{
  if (!pressed_)
  {
    return;
  }
  move(position);
  pressed_ = false;
}

void PointerState::update(std::chrono::milliseconds deltaTime)
{
  currentTime_ += std::max(deltaTime, std::chrono::milliseconds{0});
}

std::chrono::milliseconds PointerState::getPressDuration() const
{
  if (!pressed_)
  {
    return std::chrono::milliseconds{0};
  }
  return currentTime_ - pressTime_;
}

Eigen::Vector2d PointerState::getVelocity() const
{
  if (samples_.size() < 2)
  {
    return Eigen::Vector2d::Zero();
  }

  const PointerSample& first = samples_.front();
  const PointerSample& last = samples_.back();
  const double seconds =
    std::chrono::duration<double>(last.time - first.time).count();
  if (seconds <= 0.0)
  {
    return Eigen::Vector2d::Zero();
  }
  return (last.position - first.position) / seconds;
}

void PointerState::reset()
{
  pressed_ = false;
  pressPosition_.setZero();
  position_.setZero();
  maxTravel_ = 0.0;
  samples_.clear();
  currentTime_ = std::chrono::milliseconds{0};
  pressTime_ = std::chrono::milliseconds{0};
}

void PointerState::record(const Eigen::Vector2d& position)
{
  samples_.push_back(PointerSample{position, currentTime_});

  // Keep at least two samples so a fast flick still has a velocity
  while (samples_.size() > 2 &&
         currentTime_ - samples_.front().time > velocityWindow_)
  {
    samples_.pop_front();
  }
}

}  // namespace tilt_gui
