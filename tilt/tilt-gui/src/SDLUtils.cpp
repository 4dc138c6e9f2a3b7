// Ticket: 0011_preview_app

#include "tilt-gui/src/SDLUtils.hpp"

namespace tilt_gui
{

SDLContext::SDLContext(SDL_InitFlags flags)
{
  if (!SDL_Init(flags))
  {
    throw SDLException("Failed to initialize SDL");
  }
}

SDLContext::~SDLContext()
{
  SDL_Quit();
}

}  // namespace tilt_gui
