// Ticket: 0008_controller_profiles

#ifndef TILT_CORE_CONFIG_CONTROLLER_CONFIG_HPP
#define TILT_CORE_CONFIG_CONTROLLER_CONFIG_HPP

#include "tilt-core/src/DataTypes/OrientationState.hpp"
#include "tilt-core/src/Interaction/FlipController.hpp"
#include "tilt-core/src/Interaction/GestureTranslator.hpp"
#include "tilt-core/src/Interaction/InertiaIntegrator.hpp"
#include "tilt-core/src/Interaction/RotationArbiter.hpp"

namespace tilt_core
{

/**
 * @brief Complete tuning of one CardController
 *
 * Aggregates the per-component configs. Default-constructed values match
 * freeRotation(). The other named profiles restrict or retune the same
 * controller; none of them changes its structure.
 *
 * Profiles only tune behavior. Which gestures are routed is chosen by the
 * host through HostConfiguration::interactionMode, so tapOnly() is meant to be
 * paired with InteractionMode::TapOnly and carousel() with
 * InteractionMode::Disabled.
 */
struct ControllerConfig
{
  double maxTilt{OrientationState::kDefaultMaxTilt};  // [rad]

  GestureTranslator::Config gesture;
  InertiaIntegrator::Config inertia;
  FlipController::Config flip;
  RotationArbiter::Config arbiter;

  /// @throws std::invalid_argument naming the offending field
  void validate() const;

  /// Drag with friction and inertia, tap to flip, idle auto-return
  static ControllerConfig freeRotation();

  /// Carousel card: taps flip, never returns on its own
  static ControllerConfig tapOnly();

  /// First prototype: strong friction, yaw-only drag clamped to about 200
  /// degrees, quicker auto-return
  static ControllerConfig legacyFriction();

  /// Purely externally driven card in a scrolling carousel
  static ControllerConfig carousel();
};

}  // namespace tilt_core

#endif  // TILT_CORE_CONFIG_CONTROLLER_CONFIG_HPP
