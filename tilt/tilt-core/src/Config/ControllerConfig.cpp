// Ticket: 0008_controller_profiles

#include "tilt-core/src/Config/ControllerConfig.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>

namespace tilt_core
{

void ControllerConfig::validate() const
{
  if (!std::isfinite(maxTilt) || maxTilt < 0.0)
  {
    throw std::invalid_argument(
      "ControllerConfig: maxTilt must be finite and non-negative");
  }
  gesture.validate();
  inertia.validate();
  flip.validate();
  arbiter.validate();
}

ControllerConfig ControllerConfig::freeRotation()
{
  return ControllerConfig{};
}

ControllerConfig ControllerConfig::tapOnly()
{
  ControllerConfig config;
  config.flip.idleReturnDelay.reset();
  return config;
}

ControllerConfig ControllerConfig::legacyFriction()
{
  using namespace std::chrono_literals;

  ControllerConfig config;
  config.maxTilt = 0.0;

  config.gesture.rotationSpeed = 0.01;
  config.gesture.verticalDamping = 0.0;
  config.gesture.frictionThreshold = 20.0;
  config.gesture.frictionFloor = 0.0;
  config.gesture.dragAnimation = 100ms;
  config.gesture.yawLimit = M_PI * 1.11;

  config.flip.idleReturnDelay = 1500ms;
  config.flip.returnDuration = 300ms;
  config.flip.returnEasing = Easing::easeInOut();
  return config;
}

ControllerConfig ControllerConfig::carousel()
{
  ControllerConfig config;
  // Carousel pushes pitch of at most 5 degrees
  config.maxTilt = 5.0 * M_PI / 180.0;
  config.flip.idleReturnDelay.reset();
  return config;
}

}  // namespace tilt_core
