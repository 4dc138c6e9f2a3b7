// Ticket: 0011_preview_app

#ifndef TILT_GUI_SDL_HAPTICS_SINK_HPP
#define TILT_GUI_SDL_HAPTICS_SINK_HPP

#include <chrono>
#include <memory>

#include <spdlog/spdlog.h>

#include "tilt-core/src/Collaborators/HapticsSink.hpp"
#include "tilt-gui/src/SDLUtils.hpp"

namespace tilt_gui
{

/**
 * @brief Plays haptic cues as rumble on the first SDL haptic device
 *
 * Without a device (the usual case on desktops) every cue is logged at
 * debug level instead, so the cue sequence can still be followed.
 *
 * Thread safety: Not thread-safe
 */
class SDLHapticsSink final : public tilt_core::HapticsSink
{
public:
  explicit SDLHapticsSink(std::shared_ptr<spdlog::logger> logger);

  /// @throws SDLException if the device rejects the rumble
  void emit(tilt_core::HapticCue cue, double intensity) override;

  [[nodiscard]] bool hasDevice() const
  {
    return haptic_ != nullptr;
  }

  /// Rumble length used for a cue
  static std::chrono::milliseconds rumbleLength(tilt_core::HapticCue cue);

private:
  std::shared_ptr<spdlog::logger> logger_;
  UniqueHaptic haptic_;
};

}  // namespace tilt_gui

#endif  // TILT_GUI_SDL_HAPTICS_SINK_HPP
