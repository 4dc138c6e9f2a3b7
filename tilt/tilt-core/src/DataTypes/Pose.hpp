// Ticket: 0001_orientation_state

#ifndef TILT_CORE_POSE_HPP
#define TILT_CORE_POSE_HPP

#include <fmt/format.h>

namespace tilt_core
{

/**
 * @brief The observable output of a card controller
 *
 * Plain value type handed to the renderer and to the host's orientation
 * listener after every commit.
 *
 * Thread safety: Value type (safe to copy)
 */
struct Pose
{
  double yaw{0.0};    // [rad], unbounded
  double pitch{0.0};  // [rad], within the controller's tilt band
  double scale{1.0};
  bool isShowingBack{false};

  bool operator==(const Pose&) const = default;
};

}  // namespace tilt_core

template <>
struct fmt::formatter<tilt_core::Pose>
{
  constexpr auto parse(fmt::format_parse_context& ctx)
  {
    return ctx.begin();
  }

  auto format(const tilt_core::Pose& pose, fmt::format_context& ctx) const
  {
    return fmt::format_to(ctx.out(),
                          "(yaw {:.4f}, pitch {:.4f}, scale {:.3f}, {})",
                          pose.yaw,
                          pose.pitch,
                          pose.scale,
                          pose.isShowingBack ? "back" : "front");
  }
};

#endif  // TILT_CORE_POSE_HPP
