// Ticket: 0011_preview_app

#ifndef TILT_GUI_SDL_APP_HPP
#define TILT_GUI_SDL_APP_HPP

#include <chrono>
#include <cstdint>
#include <memory>

#include <SDL3/SDL.h>
#include <spdlog/spdlog.h>

#include "tilt-core/src/Carousel/CarouselPoseMapper.hpp"
#include "tilt-core/src/CardController.hpp"
#include "tilt-core/src/Config/ControllerConfig.hpp"
#include "tilt-core/src/DataTypes/CardConfiguration.hpp"
#include "tilt-gui/src/GestureRecognizer.hpp"
#include "tilt-gui/src/PreviewRenderer.hpp"
#include "tilt-gui/src/SDLHapticsSink.hpp"
#include "tilt-gui/src/SDLUtils.hpp"

namespace tilt_gui
{

/**
 * @brief Interactive preview of one card controller
 *
 * The window acts as the host: it owns the HostConfiguration, pushes it on
 * every change and feeds mouse input through a GestureRecognizer.
 *
 * Keys:
 * - 1 / 2 / 3: FreeRotation / TapOnly / Disabled
 * - N: next sample card (identity change, full rebuild)
 * - V: toggle CVV visibility
 * - C: carousel preview, the card follows the mouse across the window
 * - R: push yaw 0 and pitch 0 from the host, once
 * - + / -: scale up / down
 * - Esc: quit
 */
class SDLApplication
{
public:
  enum class Status : uint8_t
  {
    Starting,
    Running,
    Error,
    Exiting
  };

  /**
   * @param config Controller tuning
   * @param logger Logger shared by the app and the controller
   * @throws SDLException if the window or renderer cannot be created
   */
  SDLApplication(tilt_core::ControllerConfig config,
                 std::shared_ptr<spdlog::logger> logger);
  ~SDLApplication() = default;

  SDLApplication(const SDLApplication&) = delete;
  SDLApplication& operator=(const SDLApplication&) = delete;
  SDLApplication(SDLApplication&&) = delete;
  SDLApplication& operator=(SDLApplication&&) = delete;

  int runApp();

  [[nodiscard]] Status getStatus() const
  {
    return status_;
  }

private:
  void handleEvents();
  void handleKey(SDL_Keycode key);
  void pushConfiguration();
  void nextCard();
  void toggleCarousel();
  void returnToFront();
  void followCarousel(float mouseX);
  void render();

  std::shared_ptr<spdlog::logger> logger_;
  SDLContext sdl_;
  Status status_{Status::Starting};

  UniqueWindow window_;
  UniqueRenderer renderer_;

  PreviewRenderer preview_;
  SDLHapticsSink haptics_;
  tilt_core::CardController controller_;
  GestureRecognizer recognizer_;
  tilt_core::CarouselPoseMapper carousel_;

  tilt_core::HostConfiguration host_;
  size_t cardIndex_{0};
  bool carouselActive_{false};
};

}  // namespace tilt_gui

#endif  // TILT_GUI_SDL_APP_HPP
