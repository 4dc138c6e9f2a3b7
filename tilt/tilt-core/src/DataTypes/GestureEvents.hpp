// Ticket: 0003_gesture_translator

#ifndef TILT_CORE_GESTURE_EVENTS_HPP
#define TILT_CORE_GESTURE_EVENTS_HPP

#include <cstdint>

#include <Eigen/Dense>

namespace tilt_core
{

/**
 * @brief Lifecycle phase of a continuous drag
 */
enum class GesturePhase : uint8_t
{
  Began,
  Changed,
  Ended,
  Cancelled
};

/**
 * @brief One sample of a drag gesture, in view-local units
 *
 * This struct is the bridge between the gesture source (tilt-gui or a
 * platform toolkit) and the controller. It decouples pointer representation
 * from orientation logic.
 *
 * translation is cumulative since Began; velocity is instantaneous
 * [units/s] and only meaningful on Ended/Cancelled.
 *
 * Thread safety: Value type (safe to copy)
 */
struct DragEvent
{
  GesturePhase phase{GesturePhase::Began};
  Eigen::Vector2d translation{Eigen::Vector2d::Zero()};
  Eigen::Vector2d velocity{Eigen::Vector2d::Zero()};
};

}  // namespace tilt_core

#endif  // TILT_CORE_GESTURE_EVENTS_HPP
