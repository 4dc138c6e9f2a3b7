// Ticket: 0001_orientation_state

#include "tilt-core/src/DataTypes/OrientationState.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "tilt-core/src/Utils/utils.hpp"

namespace tilt_core
{

OrientationState::OrientationState(double maxTilt) : maxTilt_{maxTilt}
{
  if (!std::isfinite(maxTilt) || maxTilt < 0.0)
  {
    throw std::invalid_argument("OrientationState: maxTilt must be finite and "
                                "non-negative, got " +
                                std::to_string(maxTilt));
  }
}

bool OrientationState::setYaw(double radians)
{
  if (!std::isfinite(radians))
  {
    return false;
  }
  yaw_ = radians;
  return true;
}

bool OrientationState::setPitch(double radians)
{
  if (!std::isfinite(radians))
  {
    return false;
  }
  pitch_ = clampSymmetric(radians, maxTilt_);
  return true;
}

bool OrientationState::setScale(double scale)
{
  if (!std::isfinite(scale) || scale <= 0.0)
  {
    return false;
  }
  scale_ = scale;
  return true;
}

bool OrientationState::matchFaceToYaw()
{
  isShowingBack_ = std::cos(yaw_) < 0.0;
  return isShowingBack_;
}

void OrientationState::reset()
{
  yaw_ = 0.0;
  pitch_ = 0.0;
  scale_ = 1.0;
  isShowingBack_ = false;
}

}  // namespace tilt_core
