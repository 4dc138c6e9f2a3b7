// Ticket: 0005_interaction_modes

#ifndef TILT_CORE_INTERACTION_INTERACTION_HANDLER_HPP
#define TILT_CORE_INTERACTION_INTERACTION_HANDLER_HPP

#include <string_view>

#include <fmt/format.h>

#include "tilt-core/src/DataTypes/CardConfiguration.hpp"

namespace tilt_core
{

constexpr std::string_view toString(InteractionMode mode)
{
  switch (mode)
  {
    case InteractionMode::FreeRotation:
      return "FreeRotation";
    case InteractionMode::TapOnly:
      return "TapOnly";
    case InteractionMode::Disabled:
      return "Disabled";
  }
  return "Unknown";
}

/**
 * @brief Routes pointer input according to the active interaction mode
 *
 * The mode set is closed, so routing is a switch on the tag rather than a
 * handler hierarchy. A detached handler accepts nothing; attaching a mode
 * replaces the previous one.
 *
 * Routing table:
 * - FreeRotation: drags and taps
 * - TapOnly: taps only
 * - Disabled: nothing (the card is driven externally)
 *
 * Thread safety: Not thread-safe
 */
class InteractionHandler
{
public:
  InteractionHandler() = default;

  void attach(InteractionMode mode)
  {
    mode_ = mode;
    attached_ = true;
  }

  void detach()
  {
    attached_ = false;
  }

  [[nodiscard]] bool isAttached() const
  {
    return attached_;
  }

  [[nodiscard]] InteractionMode mode() const
  {
    return mode_;
  }

  [[nodiscard]] bool acceptsDrag() const;
  [[nodiscard]] bool acceptsTap() const;

private:
  InteractionMode mode_{InteractionMode::FreeRotation};
  bool attached_{false};
};

}  // namespace tilt_core

template <>
struct fmt::formatter<tilt_core::InteractionMode>
  : fmt::formatter<std::string_view>
{
  auto format(tilt_core::InteractionMode mode, fmt::format_context& ctx) const
  {
    return fmt::formatter<std::string_view>::format(tilt_core::toString(mode),
                                                    ctx);
  }
};

#endif  // TILT_CORE_INTERACTION_INTERACTION_HANDLER_HPP
