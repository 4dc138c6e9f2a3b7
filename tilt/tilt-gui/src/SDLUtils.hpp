// Ticket: 0011_preview_app

#ifndef TILT_GUI_SDL_UTILS_HPP
#define TILT_GUI_SDL_UTILS_HPP

#include <memory>
#include <stdexcept>
#include <string>

#include <SDL3/SDL.h>

namespace tilt_gui
{

class SDLException final : public std::runtime_error
{
public:
  explicit SDLException(const std::string& message)
    : std::runtime_error(message + ": " + SDL_GetError())
  {
  }
};

/**
 * @brief Scoped SDL initialization
 *
 * SDL_Init on construction, SDL_Quit on destruction. Declare it before any
 * other SDL resource so it outlives them.
 */
class SDLContext
{
public:
  /// @throws SDLException if SDL fails to initialize
  explicit SDLContext(SDL_InitFlags flags);
  ~SDLContext();

  SDLContext(const SDLContext&) = delete;
  SDLContext& operator=(const SDLContext&) = delete;
  SDLContext(SDLContext&&) = delete;
  SDLContext& operator=(SDLContext&&) = delete;
};

struct SDLWindowDeleter
{
  void operator()(SDL_Window* w) const
  {
    SDL_DestroyWindow(w);
  }
};

struct SDLRendererDeleter
{
  void operator()(SDL_Renderer* r) const
  {
    SDL_DestroyRenderer(r);
  }
};

struct SDLHapticDeleter
{
  void operator()(SDL_Haptic* h) const
  {
    SDL_CloseHaptic(h);
  }
};

using UniqueWindow = std::unique_ptr<SDL_Window, SDLWindowDeleter>;
using UniqueRenderer = std::unique_ptr<SDL_Renderer, SDLRendererDeleter>;
using UniqueHaptic = std::unique_ptr<SDL_Haptic, SDLHapticDeleter>;

}  // namespace tilt_gui

#endif  // TILT_GUI_SDL_UTILS_HPP
