// Ticket: 0005_interaction_modes

#include "tilt-core/src/Interaction/InteractionHandler.hpp"

namespace tilt_core
{

bool InteractionHandler::acceptsDrag() const
{
  if (!attached_)
  {
    return false;
  }

  switch (mode_)
  {
    case InteractionMode::FreeRotation:
      return true;
    case InteractionMode::TapOnly:
    case InteractionMode::Disabled:
      return false;
  }
  return false;
}

bool InteractionHandler::acceptsTap() const
{
  if (!attached_)
  {
    return false;
  }

  switch (mode_)
  {
    case InteractionMode::FreeRotation:
    case InteractionMode::TapOnly:
      return true;
    case InteractionMode::Disabled:
      return false;
  }
  return false;
}

}  // namespace tilt_core
