// Ticket: 0003_gesture_translator

#include "tilt-core/src/Interaction/GestureTranslator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "tilt-core/src/Animation/Easing.hpp"
#include "tilt-core/src/Utils/utils.hpp"

namespace tilt_core
{

namespace
{

void requireFiniteNonNegative(double value, const char* field)
{
  if (!std::isfinite(value) || value < 0.0)
  {
    throw std::invalid_argument(std::string{"GestureTranslator::Config: "} +
                                field + " must be finite and non-negative");
  }
}

}  // namespace

void GestureTranslator::Config::validate() const
{
  requireFiniteNonNegative(rotationSpeed, "rotationSpeed");
  requireFiniteNonNegative(verticalDamping, "verticalDamping");
  requireFiniteNonNegative(frictionThreshold, "frictionThreshold");
  requireFiniteNonNegative(velocityScale, "velocityScale");
  requireFiniteNonNegative(rotationCueStep, "rotationCueStep");

  if (!std::isfinite(frictionFloor) || frictionFloor < 0.0 ||
      frictionFloor > 1.0)
  {
    throw std::invalid_argument(
      "GestureTranslator::Config: frictionFloor must lie in [0, 1]");
  }
  if (dragAnimation.count() < 0)
  {
    throw std::invalid_argument(
      "GestureTranslator::Config: dragAnimation must not be negative");
  }
  if (rotationCueInterval.count() < 0)
  {
    throw std::invalid_argument(
      "GestureTranslator::Config: rotationCueInterval must not be negative");
  }
  if (yawLimit && (!std::isfinite(*yawLimit) || *yawLimit <= 0.0))
  {
    throw std::invalid_argument(
      "GestureTranslator::Config: yawLimit must be finite and positive");
  }
}

GestureTranslator::GestureTranslator(Config config) : config_{config}
{
  config_.validate();
}

void GestureTranslator::begin(const OrientationState& state)
{
  session_ = Session{};
  session_->originYaw = state.yaw();
  session_->originPitch = state.pitch();
  session_->lastCueYaw = state.yaw();
}

GestureTranslator::ChangeOutcome GestureTranslator::change(
  OrientationState& state,
  const Eigen::Vector2d& translation,
  std::chrono::milliseconds now)
{
  ChangeOutcome outcome;
  if (!session_ || !translation.allFinite())
  {
    return outcome;
  }

  Session& session = *session_;
  const double distance = translation.norm();

  if (!session.hasBrokenFriction && distance >= config_.frictionThreshold)
  {
    session.hasBrokenFriction = true;
    outcome.brokeFriction = true;
  }

  const double multiplier =
    session.hasBrokenFriction ? 1.0 : frictionMultiplier(distance);
  const double gain = config_.rotationSpeed * multiplier;

  state.setYaw(limitYaw(session.originYaw + translation.x() * gain));
  state.setPitch(session.originPitch -
                 translation.y() * gain * config_.verticalDamping);
  outcome.applied = true;

  // Continuous rotation feedback, only once the card moves freely
  if (session.hasBrokenFriction &&
      std::abs(state.yaw() - session.lastCueYaw) > config_.rotationCueStep &&
      (!session.lastCueAt ||
       now - *session.lastCueAt >= config_.rotationCueInterval))
  {
    session.lastCueYaw = state.yaw();
    session.lastCueAt = now;
    outcome.rotationTick = true;
  }

  return outcome;
}

AngularVelocity GestureTranslator::end(const Eigen::Vector2d& velocity)
{
  AngularVelocity omega{0.0, 0.0};
  if (!session_)
  {
    return omega;
  }
  session_.reset();

  if (!velocity.allFinite())
  {
    return omega;
  }

  omega.yaw() = velocity.x() * config_.velocityScale;
  omega.pitch() =
    -velocity.y() * config_.velocityScale * config_.verticalDamping;
  return omega;
}

void GestureTranslator::discard()
{
  session_.reset();
}

double GestureTranslator::frictionMultiplier(double distance) const
{
  if (config_.frictionThreshold <= 0.0 || distance >= config_.frictionThreshold)
  {
    return 1.0;
  }
  const double progress = std::max(distance, 0.0) / config_.frictionThreshold;
  return config_.frictionFloor +
         (1.0 - config_.frictionFloor) * easeOutCubic(progress);
}

double GestureTranslator::limitYaw(double yaw) const
{
  if (!config_.yawLimit)
  {
    return yaw;
  }
  return clampSymmetric(yaw, *config_.yawLimit);
}

}  // namespace tilt_core
