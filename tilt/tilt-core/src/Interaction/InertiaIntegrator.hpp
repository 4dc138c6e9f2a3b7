// Ticket: 0003_inertia_integrator

#ifndef TILT_CORE_INTERACTION_INERTIA_INTEGRATOR_HPP
#define TILT_CORE_INTERACTION_INERTIA_INTEGRATOR_HPP

#include <functional>
#include <optional>
#include <utility>

#include "tilt-core/src/DataTypes/AngularVelocity.hpp"
#include "tilt-core/src/DataTypes/OrientationState.hpp"

namespace tilt_core
{

/**
 * @brief Per-frame momentum after a drag is released
 *
 * Each step applies the current angular velocity to the orientation and then
 * decays it geometrically by decayRate. The session ends as soon as both
 * components fall below minVelocity. With decayRate in (0, 1) and a positive
 * minVelocity every finite start velocity terminates after
 * ceil(log(minVelocity / |w0|) / log(decayRate)) steps.
 *
 * Yaw is never bounded here (an optional yaw limit is injected by the
 * owner); pitch is re-clamped by OrientationState on every step.
 *
 * Thread safety: Not thread-safe
 */
class InertiaIntegrator
{
public:
  struct Config
  {
    double decayRate{0.95};     // Velocity multiplier per step, in (0, 1)
    double minVelocity{0.001};  // [rad/tick]

    /// @throws std::invalid_argument naming the offending field
    void validate() const;
  };

  using YawLimiter = std::function<double(double)>;

  /**
   * @throws std::invalid_argument if the config is invalid
   */
  explicit InertiaIntegrator(Config config);

  InertiaIntegrator() : InertiaIntegrator(Config{})
  {
  }

  /**
   * @brief Start a session
   * @return false (and no session) if the velocity is not finite or too slow
   *         to be worth integrating
   */
  bool start(const AngularVelocity& velocity);

  /**
   * @brief Advance one tick
   * @param state Orientation to write (non-owning reference)
   * @return true while the session is still active after this step
   */
  bool step(OrientationState& state);

  /// Stop immediately, leaving no residual velocity
  void cancel()
  {
    velocity_.reset();
  }

  [[nodiscard]] bool isActive() const
  {
    return velocity_.has_value();
  }

  /// Current velocity; zero when inactive
  [[nodiscard]] AngularVelocity velocity() const
  {
    return velocity_.value_or(AngularVelocity{});
  }

  /// Optional clamp applied to yaw after each step
  void setYawLimiter(YawLimiter limiter)
  {
    yawLimiter_ = std::move(limiter);
  }

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

private:
  Config config_;
  std::optional<AngularVelocity> velocity_;
  YawLimiter yawLimiter_;
};

}  // namespace tilt_core

#endif  // TILT_CORE_INTERACTION_INERTIA_INTEGRATOR_HPP
