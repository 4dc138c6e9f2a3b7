// Ticket: 0011_preview_app

#include "tilt-gui/src/PoseAnimator.hpp"

#include <algorithm>

namespace tilt_gui
{

void PoseAnimator::commit(const tilt_core::Pose& target,
                          const tilt_core::AnimationHint& hint)
{
  from_ = getDisplayed();
  to_ = target;
  hint_ = hint;
  elapsed_ = std::chrono::milliseconds{0};
}

void PoseAnimator::update(std::chrono::milliseconds deltaTime)
{
  elapsed_ += std::max(deltaTime, std::chrono::milliseconds{0});
}

tilt_core::Pose PoseAnimator::getDisplayed() const
{
  if (!isAnimating())
  {
    return to_;
  }

  const double t = static_cast<double>(elapsed_.count()) /
                   static_cast<double>(hint_.duration.count());
  const double e = hint_.easing(t);
  auto blend = [e](double a, double b) { return a + (b - a) * e; };

  return tilt_core::Pose{blend(from_.yaw, to_.yaw),
                         blend(from_.pitch, to_.pitch),
                         blend(from_.scale, to_.scale),
                         to_.isShowingBack};
}

bool PoseAnimator::isAnimating() const
{
  return !hint_.isSnap() && elapsed_ < hint_.duration;
}

}  // namespace tilt_gui
