// Ticket: 0002_easing_curves

#ifndef TILT_CORE_ANIMATION_HINT_HPP
#define TILT_CORE_ANIMATION_HINT_HPP

#include <chrono>

#include "tilt-core/src/Animation/Easing.hpp"

namespace tilt_core
{

/**
 * @brief How the renderer should move from the previous pose to a new one
 *
 * The controller's state jumps to the target immediately; the hint only
 * shapes what the renderer shows in between. A zero duration means snap.
 */
struct AnimationHint
{
  std::chrono::milliseconds duration{0};
  Easing easing{Easing::linear()};

  static AnimationHint snap()
  {
    return AnimationHint{};
  }

  [[nodiscard]] bool isSnap() const
  {
    return duration.count() <= 0;
  }

  bool operator==(const AnimationHint&) const = default;
};

}  // namespace tilt_core

#endif  // TILT_CORE_ANIMATION_HINT_HPP
