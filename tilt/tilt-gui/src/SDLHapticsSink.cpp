// Ticket: 0011_preview_app

#include "tilt-gui/src/SDLHapticsSink.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tilt_gui
{

SDLHapticsSink::SDLHapticsSink(std::shared_ptr<spdlog::logger> logger)
  : logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument{"SDLHapticsSink: logger must not be null"};
  }

  if (!SDL_InitSubSystem(SDL_INIT_HAPTIC))
  {
    logger_->warn("Haptic subsystem unavailable: {}", SDL_GetError());
    return;
  }

  int count = 0;
  SDL_HapticID* ids = SDL_GetHaptics(&count);
  if (ids == nullptr || count == 0)
  {
    SDL_free(ids);
    logger_->info("No haptic device, cues will be logged");
    return;
  }

  haptic_.reset(SDL_OpenHaptic(ids[0]));
  SDL_free(ids);
  if (!haptic_ || !SDL_InitHapticRumble(haptic_.get()))
  {
    logger_->warn("Haptic device has no rumble support: {}", SDL_GetError());
    haptic_.reset();
    return;
  }
  const char* name = SDL_GetHapticName(haptic_.get());
  logger_->info("Haptic device {}", name != nullptr ? name : "unnamed");
}

void SDLHapticsSink::emit(tilt_core::HapticCue cue, double intensity)
{
  const float strength = static_cast<float>(std::clamp(intensity, 0.0, 1.0));
  if (!haptic_)
  {
    logger_->debug("Haptic {} at {:.2f}", cue, strength);
    return;
  }

  const auto length = rumbleLength(cue);
  if (!SDL_PlayHapticRumble(
        haptic_.get(), strength, static_cast<Uint32>(length.count())))
  {
    throw SDLException("Failed to play haptic rumble");
  }
}

std::chrono::milliseconds SDLHapticsSink::rumbleLength(tilt_core::HapticCue cue)
{
  using std::chrono::milliseconds;
  switch (cue)
  {
    case tilt_core::HapticCue::RotationTick:
      return milliseconds{8};
    case tilt_core::HapticCue::GestureStart:
    case tilt_core::HapticCue::FrictionBreak:
    case tilt_core::HapticCue::SettleComplete:
      return milliseconds{20};
    case tilt_core::HapticCue::Release:
    case tilt_core::HapticCue::Flip:
      return milliseconds{40};
  }
  return milliseconds{20};
}

}  // namespace tilt_gui
