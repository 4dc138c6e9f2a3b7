// Ticket: 0004_flip_controller

#ifndef TILT_CORE_INTERACTION_FLIP_CONTROLLER_HPP
#define TILT_CORE_INTERACTION_FLIP_CONTROLLER_HPP

#include <chrono>
#include <functional>
#include <optional>

#include "tilt-core/src/Animation/AnimationHint.hpp"
#include "tilt-core/src/DataTypes/OrientationState.hpp"
#include "tilt-core/src/Scheduling/TaskScheduler.hpp"

namespace tilt_core
{

/**
 * @brief Front/back state machine and idle auto-return
 *
 * flip() toggles the face and moves the card to the rest pose of the new
 * face (yaw 0 or pi, pitch 0). Targets are absolute, so repeated flips
 * alternate between exactly 0 and pi regardless of any yaw accumulated by
 * earlier drags.
 *
 * Both timers (the settle-complete cue and the idle return) live in the
 * owner's TaskScheduler and are cancelled through their handles.
 *
 * Thread safety: Not thread-safe
 */
class FlipController
{
public:
  struct Config
  {
    std::chrono::milliseconds settleDuration{500};
    Easing settleEasing{Easing::overshoot()};

    /// Delay before returning to rest once interaction ends; unset disables
    std::optional<std::chrono::milliseconds> idleReturnDelay{
      std::chrono::milliseconds{2000}};
    std::chrono::milliseconds returnDuration{300};
    Easing returnEasing{Easing::spring()};

    /// How long before the settle animation ends the settle cue fires
    std::chrono::milliseconds settleCueLead{100};

    /// @throws std::invalid_argument naming the offending field
    void validate() const;
  };

  using Callback = std::function<void()>;

  /**
   * @param scheduler Timer source (non-owning, must outlive this object)
   * @param config Timing configuration
   * @throws std::invalid_argument if the config is invalid
   */
  FlipController(TaskScheduler& scheduler, Config config);

  explicit FlipController(TaskScheduler& scheduler)
    : FlipController(scheduler, Config{})
  {
  }

  /**
   * @brief Toggle the face and move to its rest pose
   * @param state Orientation to write (non-owning reference)
   * @param onSettled Invoked settleCueLead before the animation ends
   * @return Hint for the settle animation
   *
   * Cancels any pending settle cue and idle return first.
   */
  AnimationHint flip(OrientationState& state, Callback onSettled);

  /**
   * @brief Arm the idle timer, replacing any pending one
   * @param onIdle Invoked when the delay elapses without cancellation
   * @return false if auto-return is disabled by the config
   */
  bool armIdleReturn(Callback onIdle);

  /// Move to the rest pose of the current face without toggling
  AnimationHint returnToRest(OrientationState& state) const;

  void cancelIdleReturn();
  void cancelSettleCue();

  void cancelAll()
  {
    cancelIdleReturn();
    cancelSettleCue();
  }

  [[nodiscard]] bool isIdleReturnPending() const;
  [[nodiscard]] bool isSettleCuePending() const;

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

  FlipController(const FlipController&) = delete;
  FlipController& operator=(const FlipController&) = delete;
  FlipController(FlipController&&) = delete;
  FlipController& operator=(FlipController&&) = delete;
  ~FlipController() = default;

private:
  TaskScheduler& scheduler_;
  Config config_;
  TaskScheduler::Handle idleHandle_{TaskScheduler::kInvalidHandle};
  TaskScheduler::Handle settleHandle_{TaskScheduler::kInvalidHandle};
};

}  // namespace tilt_core

#endif  // TILT_CORE_INTERACTION_FLIP_CONTROLLER_HPP
