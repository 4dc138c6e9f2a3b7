// Ticket: 0007_card_controller

#ifndef TILT_CORE_COLLABORATORS_HAPTICS_SINK_HPP
#define TILT_CORE_COLLABORATORS_HAPTICS_SINK_HPP

#include <cstdint>
#include <string_view>

#include <fmt/format.h>

namespace tilt_core
{

enum class HapticCue : uint8_t
{
  GestureStart,
  FrictionBreak,
  RotationTick,
  Release,
  Flip,
  SettleComplete
};

/// Intensity in [0, 1] the controller uses for each cue
constexpr double defaultIntensity(HapticCue cue)
{
  switch (cue)
  {
    case HapticCue::GestureStart:
      return 0.8;
    case HapticCue::FrictionBreak:
      return 0.8;
    case HapticCue::RotationTick:
      return 1.0;
    case HapticCue::Release:
      return 0.7;
    case HapticCue::Flip:
      return 0.8;
    case HapticCue::SettleComplete:
      return 0.5;
  }
  return 0.0;
}

constexpr std::string_view toString(HapticCue cue)
{
  switch (cue)
  {
    case HapticCue::GestureStart:
      return "GestureStart";
    case HapticCue::FrictionBreak:
      return "FrictionBreak";
    case HapticCue::RotationTick:
      return "RotationTick";
    case HapticCue::Release:
      return "Release";
    case HapticCue::Flip:
      return "Flip";
    case HapticCue::SettleComplete:
      return "SettleComplete";
  }
  return "Unknown";
}

/**
 * @brief Abstract receiver of tactile feedback cues
 *
 * Fire-and-forget. An implementation may throw; the controller logs the
 * failure and carries on without touching the orientation.
 */
class HapticsSink
{
public:
  virtual ~HapticsSink() = default;

  /**
   * @param cue What happened
   * @param intensity Strength in [0, 1]
   */
  virtual void emit(HapticCue cue, double intensity) = 0;

protected:
  HapticsSink() = default;
  HapticsSink(const HapticsSink&) = default;
  HapticsSink& operator=(const HapticsSink&) = default;
  HapticsSink(HapticsSink&&) noexcept = default;
  HapticsSink& operator=(HapticsSink&&) noexcept = default;
};

}  // namespace tilt_core

template <>
struct fmt::formatter<tilt_core::HapticCue> : fmt::formatter<std::string_view>
{
  auto format(tilt_core::HapticCue cue, fmt::format_context& ctx) const
  {
    return fmt::formatter<std::string_view>::format(tilt_core::toString(cue),
                                                    ctx);
  }
};

#endif  // TILT_CORE_COLLABORATORS_HAPTICS_SINK_HPP
