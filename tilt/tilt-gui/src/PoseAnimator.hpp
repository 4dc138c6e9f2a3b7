// Ticket: 0011_preview_app

#ifndef TILT_GUI_POSE_ANIMATOR_HPP
#define TILT_GUI_POSE_ANIMATOR_HPP

#include <chrono>

#include "tilt-core/src/Animation/AnimationHint.hpp"
#include "tilt-core/src/DataTypes/Pose.hpp"

namespace tilt_gui
{

/**
 * @brief Plays committed poses back over time
 *
 * Each commit starts a new segment from whatever is displayed at that
 * moment, so an interrupted animation continues smoothly toward the new
 * target. Yaw, pitch and scale are blended with the hint's easing; the
 * overshoot and spring curves may carry the displayed pose past the target
 * before it settles.
 *
 * Thread safety: Not thread-safe
 */
class PoseAnimator
{
public:
  /// Start a segment from the displayed pose toward target
  void commit(const tilt_core::Pose& target,
              const tilt_core::AnimationHint& hint);

  /// Advance the animation clock
  void update(std::chrono::milliseconds deltaTime);

  /// Pose to draw at the current time
  [[nodiscard]] tilt_core::Pose getDisplayed() const;

  [[nodiscard]] const tilt_core::Pose& getTarget() const
  {
    return to_;
  }

  [[nodiscard]] bool isAnimating() const;

private:
  tilt_core::Pose from_;
  tilt_core::Pose to_;
  tilt_core::AnimationHint hint_;
  std::chrono::milliseconds elapsed_{0};
};

}  // namespace tilt_gui

#endif  // TILT_GUI_POSE_ANIMATOR_HPP
