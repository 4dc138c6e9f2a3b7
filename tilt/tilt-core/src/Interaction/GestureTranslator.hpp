// Ticket: 0003_gesture_translator

#ifndef TILT_CORE_INTERACTION_GESTURE_TRANSLATOR_HPP
#define TILT_CORE_INTERACTION_GESTURE_TRANSLATOR_HPP

#include <chrono>
#include <optional>

#include <Eigen/Dense>

#include "tilt-core/src/Animation/AnimationHint.hpp"
#include "tilt-core/src/DataTypes/AngularVelocity.hpp"
#include "tilt-core/src/DataTypes/OrientationState.hpp"

namespace tilt_core
{

/**
 * @brief Converts a drag gesture into yaw/pitch
 *
 * Yaw follows the horizontal translation, pitch follows the vertical
 * translation damped and clamped to the tilt band. Small movements are
 * resisted by a break-away friction multiplier that eases from frictionFloor
 * up to 1 as the drag approaches frictionThreshold; once the threshold is
 * crossed the session rotates at full speed until release.
 *
 * Rotation is always relative to the pose snapshotted at begin(), so the
 * result never depends on how many change events were delivered.
 *
 * Thread safety: Not thread-safe
 */
class GestureTranslator
{
public:
  struct Config
  {
    double rotationSpeed{0.012};     // [rad/unit]
    double verticalDamping{0.4};     // Pitch gain relative to yaw
    double frictionThreshold{8.0};   // [units]
    double frictionFloor{0.4};       // Multiplier at zero displacement
    double velocityScale{2e-5};      // [rad/tick per unit/s]
    std::chrono::milliseconds dragAnimation{80};
    std::optional<double> yawLimit;  // [rad], symmetric; unset = unbounded
    double rotationCueStep{0.01};    // [rad]
    std::chrono::milliseconds rotationCueInterval{50};

    /// @throws std::invalid_argument naming the offending field
    void validate() const;
  };

  /// Exists only between begin() and end()/discard()
  struct Session
  {
    double originYaw{0.0};
    double originPitch{0.0};
    bool hasBrokenFriction{false};
    double lastCueYaw{0.0};
    std::optional<std::chrono::milliseconds> lastCueAt;
  };

  /// What a change event produced besides the new orientation
  struct ChangeOutcome
  {
    bool applied{false};        // false if the event was rejected
    bool brokeFriction{false};  // Threshold crossed by this event
    bool rotationTick{false};   // A rotation cue is due
  };

  /**
   * @throws std::invalid_argument if the config is invalid
   */
  explicit GestureTranslator(Config config);

  GestureTranslator() : GestureTranslator(Config{})
  {
  }

  /// Snapshot the origin pose and reset the friction flag
  void begin(const OrientationState& state);

  /**
   * @brief Apply the cumulative translation of the active session
   * @param state Orientation to write (non-owning reference)
   * @param translation Cumulative since begin() [units]
   * @param now Current controller time, used to throttle rotation cues
   *
   * No-op without an active session or for a non-finite translation.
   */
  ChangeOutcome change(OrientationState& state,
                       const Eigen::Vector2d& translation,
                       std::chrono::milliseconds now);

  /**
   * @brief Close the session and convert the release velocity
   * @param velocity Instantaneous pointer velocity [units/s]
   * @return Initial angular velocity for inertia [rad/tick]; zero if there
   *         was no session or the velocity was not finite
   */
  AngularVelocity end(const Eigen::Vector2d& velocity);

  /// Drop the session without producing any velocity
  void discard();

  [[nodiscard]] bool isActive() const
  {
    return session_.has_value();
  }

  [[nodiscard]] const std::optional<Session>& session() const
  {
    return session_;
  }

  /// Rotation multiplier for a displacement while friction holds
  [[nodiscard]] double frictionMultiplier(double distance) const;

  /// Apply the optional yaw limit
  [[nodiscard]] double limitYaw(double yaw) const;

  [[nodiscard]] AnimationHint dragHint() const
  {
    return AnimationHint{config_.dragAnimation, Easing::easeOut()};
  }

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

private:
  Config config_;
  std::optional<Session> session_;
};

}  // namespace tilt_core

#endif  // TILT_CORE_INTERACTION_GESTURE_TRANSLATOR_HPP
