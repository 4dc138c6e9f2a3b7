// Ticket: 0011_preview_app

#include "tilt-gui/src/SDLApp.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "tilt-core/src/Interaction/InteractionHandler.hpp"

namespace tilt_gui
{

namespace
{

struct SampleCard
{
  tilt_core::CardIdentity identity;
  tilt_core::CardStyle style;
};

const std::array<SampleCard, 3>& sampleCards()
{
  static const std::array<SampleCard, 3> cards{
    SampleCard{{"JANE DOE", "4532 1234 5678 9010", "12/28", "123"},
               {tilt_core::CardStyle::Kind::OpaqueTextured, 1, {}}},
    SampleCard{{"JOHN ROE", "5500 0000 0000 0004", "03/27", "918"},
               {tilt_core::CardStyle::Kind::OpaqueTextured, 3, {}}},
    SampleCard{{"ALEX POE", "3782 822463 10005", "07/29", "4411"},
               {tilt_core::CardStyle::Kind::AlphaTextured, 1, 0xD4AF37C0}}};
  return cards;
}

UniqueWindow createWindow()
{
  UniqueWindow window{
    SDL_CreateWindow("Tilt Card Preview", 800, 600, SDL_WINDOW_RESIZABLE)};
  if (!window)
  {
    throw SDLException("Failed to create SDL window");
  }
  return window;
}

UniqueRenderer createRenderer(SDL_Window& window)
{
  UniqueRenderer renderer{SDL_CreateRenderer(&window, nullptr)};
  if (!renderer)
  {
    throw SDLException("Failed to create SDL renderer");
  }
  return renderer;
}

constexpr double kScaleStep = 0.1;
constexpr double kMinScale = 0.3;
constexpr double kMaxScale = 2.0;

}  // namespace

SDLApplication::SDLApplication(tilt_core::ControllerConfig config,
                               std::shared_ptr<spdlog::logger> logger)
  : logger_{std::move(logger)},
    sdl_{SDL_INIT_VIDEO},
    window_{createWindow()},
    renderer_{createRenderer(*window_)},
    preview_{*renderer_, logger_},
    haptics_{logger_},
    controller_{std::move(config), logger_},
    carousel_{tilt_core::CarouselPoseMapper::Config{25.0, 5.0, 0.8, true}}
{
  if (!SDL_SetRenderVSync(renderer_.get(), 1))
  {
    logger_->warn("VSync unavailable: {}", SDL_GetError());
  }

  controller_.setHapticsSink(&haptics_);
  controller_.setOrientationListener(
    [this](const tilt_core::Pose& pose) { logger_->trace("Pose {}", pose); });

  recognizer_.setDragHandler([this](const tilt_core::DragEvent& event)
                             { controller_.handleDrag(event); });
  recognizer_.setTapHandler([this]() { controller_.handleTap(); });

  const SampleCard& card = sampleCards()[cardIndex_];
  host_.identity = card.identity;
  host_.style = card.style;
  controller_.applyConfiguration(host_);
  controller_.attachRenderer(preview_);

  status_ = Status::Running;
}

int SDLApplication::runApp()
{
  SDL_ShowWindow(window_.get());

  uint64_t lastTicks = SDL_GetTicks();
  try
  {
    while (status_ == Status::Running)
    {
      handleEvents();

      const uint64_t nowTicks = SDL_GetTicks();
      const std::chrono::milliseconds dt{nowTicks - lastTicks};
      lastTicks = nowTicks;

      recognizer_.update(dt);
      controller_.update(dt);
      preview_.update(dt);

      render();
    }
  }
  catch (const SDLException& e)
  {
    logger_->error("{}", e.what());
    status_ = Status::Error;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

void SDLApplication::handleEvents()
{
  SDL_Event event;
  while (SDL_PollEvent(&event))
  {
    switch (event.type)
    {
      case SDL_EVENT_QUIT:
        status_ = Status::Exiting;
        break;
      case SDL_EVENT_KEY_DOWN:
        if (!event.key.repeat)
        {
          handleKey(event.key.key);
        }
        break;
      case SDL_EVENT_MOUSE_MOTION:
        if (carouselActive_)
        {
          followCarousel(event.motion.x);
        }
        else
        {
          recognizer_.handleSDLEvent(event);
        }
        break;
      default:
        if (!carouselActive_)
        {
          recognizer_.handleSDLEvent(event);
        }
        break;
    }
  }
}

void SDLApplication::handleKey(SDL_Keycode key)
{
  switch (key)
  {
    case SDLK_ESCAPE:
      status_ = Status::Exiting;
      return;
    case SDLK_1:
      host_.interactionMode = tilt_core::InteractionMode::FreeRotation;
      break;
    case SDLK_2:
      host_.interactionMode = tilt_core::InteractionMode::TapOnly;
      break;
    case SDLK_3:
      host_.interactionMode = tilt_core::InteractionMode::Disabled;
      break;
    case SDLK_N:
      nextCard();
      break;
    case SDLK_V:
      host_.visibility.cvv = !host_.visibility.cvv;
      break;
    case SDLK_C:
      toggleCarousel();
      break;
    case SDLK_R:
      returnToFront();
      return;
    case SDLK_EQUALS:
    case SDLK_PLUS:
      host_.scale = std::min(host_.scale + kScaleStep, kMaxScale);
      break;
    case SDLK_MINUS:
      host_.scale = std::max(host_.scale - kScaleStep, kMinScale);
      break;
    default:
      return;
  }
  pushConfiguration();
}

void SDLApplication::pushConfiguration()
{
  controller_.applyConfiguration(host_);
}

void SDLApplication::nextCard()
{
  cardIndex_ = (cardIndex_ + 1) % sampleCards().size();
  host_.identity = sampleCards()[cardIndex_].identity;
  host_.style = sampleCards()[cardIndex_].style;
  logger_->info("Showing card {}", cardIndex_ + 1);
}

void SDLApplication::toggleCarousel()
{
  carouselActive_ = !carouselActive_;
  recognizer_.cancel();

  if (carouselActive_)
  {
    host_.interactionMode = tilt_core::InteractionMode::Disabled;
  }
  else
  {
    host_.interactionMode = tilt_core::InteractionMode::FreeRotation;
    host_.scale = 1.0;
    returnToFront();
  }
  logger_->info("Carousel preview {}", carouselActive_ ? "on" : "off");
}

void SDLApplication::returnToFront()
{
  // One-shot push; leaving the axes set would pin the card on later pushes
  host_.externalYaw = 0.0;
  host_.externalPitch = 0.0;
  pushConfiguration();
  host_.externalYaw.reset();
  host_.externalPitch.reset();
}

void SDLApplication::followCarousel(float mouseX)
{
  int width = 0;
  int height = 0;
  SDL_GetWindowSize(window_.get(), &width, &height);

  const auto pose =
    carousel_.map(static_cast<double>(mouseX), static_cast<double>(width));
  if (!pose)
  {
    return;
  }
  tilt_core::applyCarouselPose(*pose, host_);
  pushConfiguration();
}

void SDLApplication::render()
{
  int width = 0;
  int height = 0;
  SDL_GetWindowSize(window_.get(), &width, &height);

  SDL_SetRenderDrawColor(renderer_.get(), 24, 24, 28, 255);
  SDL_RenderClear(renderer_.get());

  if (width > 0 && height > 0)
  {
    preview_.draw(static_cast<float>(width), static_cast<float>(height));
  }

  const std::string hud = fmt::format("{} | {}{}",
                                      controller_.getInteractionMode(),
                                      controller_.getPose(),
                                      carouselActive_ ? " | carousel" : "");
  SDL_SetRenderDrawColor(renderer_.get(), 200, 200, 200, 255);
  SDL_RenderDebugText(renderer_.get(), 8.0f, 8.0f, hud.c_str());

  SDL_RenderPresent(renderer_.get());
}

}  // namespace tilt_gui
