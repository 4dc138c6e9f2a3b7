// Ticket: 0011_preview_app

#include "tilt-gui/src/GestureRecognizer.hpp"

#include <stdexcept>
#include <utility>

namespace tilt_gui
{

namespace
{

GestureRecognizer::Config validated(GestureRecognizer::Config config)
{
  config.validate();
  return config;
}

}  // namespace

void GestureRecognizer::Config::validate() const
{
  if (!(tapSlop >= 0.0))
  {
    throw std::invalid_argument{"GestureRecognizer: tapSlop must be >= 0"};
  }
  if (tapMaxDuration.count() < 0)
  {
    throw std::invalid_argument{
      "GestureRecognizer: tapMaxDuration must be >= 0"};
  }
  if (velocityWindow.count() <= 0)
  {
    throw std::invalid_argument{
      "GestureRecognizer: velocityWindow must be > 0"};
  }
}

GestureRecognizer::GestureRecognizer() : GestureRecognizer{Config{}}
{
}

GestureRecognizer::GestureRecognizer(Config config)
  : config_{validated(std::move(config))}, pointer_{config_.velocityWindow}
{
}

void GestureRecognizer::handleSDLEvent(const SDL_Event& event)
{
  switch (event.type)
  {
    case SDL_EVENT_MOUSE_BUTTON_DOWN:
      if (event.button.button == SDL_BUTTON_LEFT)
      {
        pointerDown(Eigen::Vector2d{event.button.x, event.button.y});
      }
      break;
    case SDL_EVENT_MOUSE_MOTION:
      pointerMove(Eigen::Vector2d{event.motion.x, event.motion.y});
      break;
    case SDL_EVENT_MOUSE_BUTTON_UP:
      if (event.button.button == SDL_BUTTON_LEFT)
      {
        pointerUp(Eigen::Vector2d{event.button.x, event.button.y});
      }
      break;
    case SDL_EVENT_WINDOW_FOCUS_LOST:
      cancel();
      break;
    default:
      break;
  }
}

void GestureRecognizer::pointerDown(const Eigen::Vector2d& position)
{
  if (pointer_.isPressed())
  {
    // A second press without a release; the first one is lost
    cancel();
  }
  pointer_.press(position);
  emitDrag(tilt_core::GesturePhase::Began);
}

void GestureRecognizer::pointerMove(const Eigen::Vector2d& position)
{
  if (!pointer_.isPressed())
  {
    return;
  }
  pointer_.move(position);
  emitDrag(tilt_core::GesturePhase::Changed);
}

void GestureRecognizer::pointerUp(const Eigen::Vector2d& position)
{
  if (!pointer_.isPressed())
  {
    return;
  }

  const auto heldFor = pointer_.getPressDuration();
  pointer_.release(position);

  const bool isTap = pointer_.getMaxTravel() < config_.tapSlop &&
                     heldFor <= config_.tapMaxDuration;
  if (isTap && onTap_)
  {
    onTap_();
  }
  emitDrag(tilt_core::GesturePhase::Ended,
           isTap ? Eigen::Vector2d::Zero() : pointer_.getVelocity());
}

void GestureRecognizer::cancel()
{
  if (!pointer_.isPressed())
  {
    return;
  }
  pointer_.release(pointer_.getPosition());
  emitDrag(tilt_core::GesturePhase::Cancelled);
}

void GestureRecognizer::update(std::chrono::milliseconds deltaTime)
{
  pointer_.update(deltaTime);
}

void GestureRecognizer::emitDrag(tilt_core::GesturePhase phase,
                                 const Eigen::Vector2d& velocity)
{
  if (onDrag_)
  {
    onDrag_(tilt_core::DragEvent{phase, pointer_.getTranslation(), velocity});
  }
}

}  // namespace tilt_gui
