// Ticket: 0001_orientation_state

#ifndef TILT_CORE_ORIENTATION_STATE_HPP
#define TILT_CORE_ORIENTATION_STATE_HPP

#include <cmath>

#include "tilt-core/src/DataTypes/Pose.hpp"

namespace tilt_core
{

/**
 * @brief Authoritative orientation record of a single card
 *
 * Holds yaw, pitch, scale and the discrete flip flag. The setters enforce
 * the invariants so no writer can leave the record out of range:
 * - yaw is never wrapped (momentum can carry it past +/-pi)
 * - pitch is clamped to [-maxTilt, +maxTilt]
 * - scale stays strictly positive
 * - non-finite writes are ignored and the previous value is kept
 *
 * Owned by exactly one CardController; never shared between cards.
 *
 * Thread safety: Not thread-safe
 */
class OrientationState
{
public:
  static constexpr double kDefaultMaxTilt = 0.15;

  /**
   * @brief Construct a state at rest (front face, yaw 0, pitch 0, scale 1)
   * @param maxTilt Half-width of the pitch band [rad]
   * @throws std::invalid_argument if maxTilt is negative or not finite
   */
  explicit OrientationState(double maxTilt = kDefaultMaxTilt);

  [[nodiscard]] double yaw() const
  {
    return yaw_;
  }

  [[nodiscard]] double pitch() const
  {
    return pitch_;
  }

  [[nodiscard]] double scale() const
  {
    return scale_;
  }

  [[nodiscard]] bool isShowingBack() const
  {
    return isShowingBack_;
  }

  [[nodiscard]] double maxTilt() const
  {
    return maxTilt_;
  }

  /// Rest yaw of the face currently shown: 0 for the front, pi for the back
  [[nodiscard]] double restYaw() const
  {
    return isShowingBack_ ? M_PI : 0.0;
  }

  /// @return false if the value was rejected (not finite)
  bool setYaw(double radians);

  /// Clamps into the tilt band. @return false if the value was rejected
  bool setPitch(double radians);

  /// @return false if the value was rejected (not finite or not positive)
  bool setScale(double scale);

  void setShowingBack(bool showingBack)
  {
    isShowingBack_ = showingBack;
  }

  /// Toggle the flip flag and return the new value
  bool toggleFace()
  {
    isShowingBack_ = !isShowingBack_;
    return isShowingBack_;
  }

  /**
   * @brief Set the flip flag to the face that yaw currently shows
   *
   * The back is shown when cos(yaw) < 0, so an externally seeded yaw of pi
   * (or 3pi, -pi, ...) selects the back and restYaw() stays consistent with
   * it. Yaw itself is left untouched.
   *
   * @return The new value of the flip flag
   */
  bool matchFaceToYaw();

  /// Back to the front face at yaw 0, pitch 0, scale 1
  void reset();

  [[nodiscard]] Pose toPose() const
  {
    return Pose{yaw_, pitch_, scale_, isShowingBack_};
  }

  OrientationState(const OrientationState&) = default;
  OrientationState& operator=(const OrientationState&) = default;
  OrientationState(OrientationState&&) noexcept = default;
  OrientationState& operator=(OrientationState&&) noexcept = default;
  ~OrientationState() = default;

private:
  double maxTilt_;
  double yaw_{0.0};
  double pitch_{0.0};
  double scale_{1.0};
  bool isShowingBack_{false};
};

}  // namespace tilt_core

#endif  // TILT_CORE_ORIENTATION_STATE_HPP
