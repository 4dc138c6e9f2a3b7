// Ticket: 0009_carousel_pose_mapper

#include "tilt-core/src/Carousel/CarouselPoseMapper.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tilt_core
{

namespace
{

constexpr double kDegToRad = M_PI / 180.0;

}  // namespace

void CarouselPoseMapper::Config::validate() const
{
  if (!std::isfinite(maxYawDegrees) || maxYawDegrees < 0.0)
  {
    throw std::invalid_argument(
      "CarouselPoseMapper::Config: maxYawDegrees must be finite and "
      "non-negative");
  }
  if (!std::isfinite(maxPitchDegrees) || maxPitchDegrees < 0.0)
  {
    throw std::invalid_argument(
      "CarouselPoseMapper::Config: maxPitchDegrees must be finite and "
      "non-negative");
  }
  if (!(minScale > 0.0 && minScale <= 1.0))
  {
    throw std::invalid_argument(
      "CarouselPoseMapper::Config: minScale must lie in (0, 1]");
  }
}

CarouselPoseMapper::CarouselPoseMapper(Config config) : config_{config}
{
  config_.validate();
}

std::optional<CarouselPose> CarouselPoseMapper::map(double cardMidX,
                                                    double viewportWidth) const
{
  if (!std::isfinite(cardMidX) || !std::isfinite(viewportWidth) ||
      viewportWidth <= 0.0)
  {
    return std::nullopt;
  }

  const double halfWidth = viewportWidth / 2.0;
  const double normalized =
    std::clamp((cardMidX - halfWidth) / halfWidth, -1.0, 1.0);
  const double magnitude = std::abs(normalized);

  double yawDegrees = -normalized * config_.maxYawDegrees;
  if (config_.roundToWholeDegrees)
  {
    // Default rounding mode is round-half-to-even
    yawDegrees = std::nearbyint(yawDegrees);
  }

  CarouselPose pose;
  pose.yaw = yawDegrees * kDegToRad;
  pose.pitch = -magnitude * config_.maxPitchDegrees * kDegToRad;
  pose.scale = 1.0 - magnitude * (1.0 - config_.minScale);
  return pose;
}

void applyCarouselPose(const CarouselPose& pose, HostConfiguration& config)
{
  config.externalYaw = pose.yaw;
  config.externalPitch = pose.pitch;
  config.scale = pose.scale;
}

}  // namespace tilt_core
