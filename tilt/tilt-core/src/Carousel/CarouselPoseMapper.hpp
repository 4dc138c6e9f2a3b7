// Ticket: 0009_carousel_pose_mapper

#ifndef TILT_CORE_CAROUSEL_POSE_MAPPER_HPP
#define TILT_CORE_CAROUSEL_POSE_MAPPER_HPP

#include <optional>

#include "tilt-core/src/DataTypes/CardConfiguration.hpp"

namespace tilt_core
{

/// External orientation for one carousel card [rad]
struct CarouselPose
{
  double yaw{0.0};
  double pitch{0.0};
  double scale{1.0};
};

/**
 * @brief Maps a card's horizontal position in a carousel to its pose
 *
 * The card's offset from the viewport centre is normalized to [-1, 1]:
 * - yaw turns the card toward the centre, up to maxYawDegrees
 * - pitch tips it back by up to maxPitchDegrees on either side
 * - scale shrinks linearly toward minScale at the edges
 *
 * With roundToWholeDegrees the yaw is snapped to whole degrees (ties to
 * even) so a slowly scrolling carousel only pushes discrete changes.
 *
 * Thread safety: Stateless after construction (safe to share)
 */
class CarouselPoseMapper
{
public:
  struct Config
  {
    double maxYawDegrees{25.0};
    double maxPitchDegrees{5.0};
    double minScale{0.8};
    bool roundToWholeDegrees{false};

    /// @throws std::invalid_argument naming the offending field
    void validate() const;
  };

  /**
   * @throws std::invalid_argument if the config is invalid
   */
  explicit CarouselPoseMapper(Config config);

  CarouselPoseMapper() : CarouselPoseMapper(Config{})
  {
  }

  /**
   * @brief Pose for a card centred at cardMidX
   * @param cardMidX Horizontal centre of the card, viewport coordinates
   * @param viewportWidth Width of the viewport
   * @return std::nullopt for a non-positive width or non-finite input
   */
  [[nodiscard]] std::optional<CarouselPose> map(double cardMidX,
                                                double viewportWidth) const;

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

private:
  Config config_;
};

/// Write a carousel pose into the external fields of a host configuration
void applyCarouselPose(const CarouselPose& pose, HostConfiguration& config);

}  // namespace tilt_core

#endif  // TILT_CORE_CAROUSEL_POSE_MAPPER_HPP
