// Ticket: 0006_rotation_arbiter

#include "tilt-core/src/Interaction/RotationArbiter.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "tilt-core/src/Utils/utils.hpp"

namespace tilt_core
{

void RotationArbiter::Config::validate() const
{
  if (!std::isfinite(rotationEpsilon) || rotationEpsilon < 0.0)
  {
    throw std::invalid_argument(
      "RotationArbiter::Config: rotationEpsilon must be finite and "
      "non-negative");
  }
  if (!std::isfinite(scaleEpsilon) || scaleEpsilon < 0.0)
  {
    throw std::invalid_argument(
      "RotationArbiter::Config: scaleEpsilon must be finite and non-negative");
  }
  if (defaultAnimationDuration.count() <= 0)
  {
    throw std::invalid_argument(
      "RotationArbiter::Config: defaultAnimationDuration must be positive");
  }
}

RotationArbiter::RotationArbiter(Config config,
                                 std::shared_ptr<spdlog::logger> logger)
  : config_{config}, logger_{std::move(logger)}
{
  config_.validate();
  if (!logger_)
  {
    throw std::invalid_argument("RotationArbiter: logger must not be null");
  }
}

Arbitration RotationArbiter::arbitrate(const HostConfiguration& incoming,
                                       const OrientationState& state,
                                       bool sessionActive) const
{
  Arbitration result;

  result.animationDuration = incoming.animationDuration;
  if (result.animationDuration.count() <= 0)
  {
    logger_->debug("Rejected animation duration {} ms, using {} ms",
                   incoming.animationDuration.count(),
                   config_.defaultAnimationDuration.count());
    result.animationDuration = config_.defaultAnimationDuration;
  }

  ExternalTargets targets = sanitize(incoming, state);

  if (!built_ || *built_ != appearanceOf(incoming))
  {
    result.decision = RebuildDecision::FullRebuild;
    result.targets = targets;
    return result;
  }

  if (targets.yaw &&
      std::abs(*targets.yaw - state.yaw()) <= config_.rotationEpsilon)
  {
    targets.yaw.reset();
  }
  if (targets.pitch &&
      std::abs(*targets.pitch - state.pitch()) <= config_.rotationEpsilon)
  {
    targets.pitch.reset();
  }
  if (targets.scale &&
      std::abs(*targets.scale - state.scale()) <= config_.scaleEpsilon)
  {
    targets.scale.reset();
  }

  if (sessionActive && (targets.yaw || targets.pitch))
  {
    logger_->debug("Ignoring external rotation while a session is active");
    targets.yaw.reset();
    targets.pitch.reset();
  }

  result.decision =
    targets.empty() ? RebuildDecision::Noop : RebuildDecision::Repose;
  result.targets = targets;
  return result;
}

void RotationArbiter::markRebuilt(const HostConfiguration& applied)
{
  built_ = appearanceOf(applied);
}

void RotationArbiter::invalidate()
{
  built_.reset();
}

RotationArbiter::Appearance RotationArbiter::appearanceOf(
  const HostConfiguration& config)
{
  return Appearance{config.identity, config.style, config.visibility};
}

ExternalTargets RotationArbiter::sanitize(const HostConfiguration& incoming,
                                          const OrientationState& state) const
{
  ExternalTargets targets;

  if (incoming.externalYaw)
  {
    if (std::isfinite(*incoming.externalYaw))
    {
      targets.yaw = *incoming.externalYaw;
    }
    else
    {
      logger_->debug("Rejected external yaw {}", *incoming.externalYaw);
    }
  }

  if (incoming.externalPitch)
  {
    if (std::isfinite(*incoming.externalPitch))
    {
      targets.pitch = clampSymmetric(*incoming.externalPitch, state.maxTilt());
    }
    else
    {
      logger_->debug("Rejected external pitch {}", *incoming.externalPitch);
    }
  }

  if (std::isfinite(incoming.scale) && incoming.scale > 0.0)
  {
    targets.scale = incoming.scale;
  }
  else
  {
    logger_->debug("Rejected scale {}", incoming.scale);
  }

  return targets;
}

}  // namespace tilt_core
