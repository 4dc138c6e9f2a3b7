// Ticket: 0003_inertia_integrator

#include "tilt-core/src/Interaction/InertiaIntegrator.hpp"

#include <cmath>
#include <stdexcept>

namespace tilt_core
{

void InertiaIntegrator::Config::validate() const
{
  if (!(decayRate > 0.0 && decayRate < 1.0))
  {
    throw std::invalid_argument(
      "InertiaIntegrator::Config: decayRate must lie in (0, 1)");
  }
  if (!std::isfinite(minVelocity) || minVelocity <= 0.0)
  {
    throw std::invalid_argument(
      "InertiaIntegrator::Config: minVelocity must be finite and positive");
  }
}

InertiaIntegrator::InertiaIntegrator(Config config) : config_{config}
{
  config_.validate();
}

bool InertiaIntegrator::start(const AngularVelocity& velocity)
{
  velocity_.reset();
  if (!velocity.isFinite() || velocity.norm() <= config_.minVelocity)
  {
    return false;
  }
  velocity_ = velocity;
  return true;
}

bool InertiaIntegrator::step(OrientationState& state)
{
  if (!velocity_)
  {
    return false;
  }

  AngularVelocity& omega = *velocity_;

  double yaw = state.yaw() + omega.yaw();
  if (yawLimiter_)
  {
    yaw = yawLimiter_(yaw);
  }
  state.setYaw(yaw);
  state.setPitch(state.pitch() + omega.pitch());

  omega *= config_.decayRate;

  if (omega.isBelow(config_.minVelocity))
  {
    velocity_.reset();
    return false;
  }
  return true;
}

}  // namespace tilt_core
