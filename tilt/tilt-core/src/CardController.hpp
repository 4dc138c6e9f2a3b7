// Ticket: 0007_card_controller

#ifndef TILT_CORE_CARD_CONTROLLER_HPP
#define TILT_CORE_CARD_CONTROLLER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

#include "tilt-core/src/Collaborators/HapticsSink.hpp"
#include "tilt-core/src/Collaborators/Renderer.hpp"
#include "tilt-core/src/Config/ControllerConfig.hpp"
#include "tilt-core/src/DataTypes/CardConfiguration.hpp"
#include "tilt-core/src/DataTypes/GestureEvents.hpp"
#include "tilt-core/src/DataTypes/OrientationState.hpp"
#include "tilt-core/src/DataTypes/Pose.hpp"
#include "tilt-core/src/Interaction/FlipController.hpp"
#include "tilt-core/src/Interaction/GestureTranslator.hpp"
#include "tilt-core/src/Interaction/InertiaIntegrator.hpp"
#include "tilt-core/src/Interaction/InteractionHandler.hpp"
#include "tilt-core/src/Interaction/RotationArbiter.hpp"
#include "tilt-core/src/Scheduling/TaskScheduler.hpp"

namespace tilt_core
{

/**
 * @brief Orientation controller of a single interactive card
 *
 * Owns the card's OrientationState and every source that may write it:
 * - drag gestures (GestureTranslator)
 * - momentum after release (InertiaIntegrator, stepped by update())
 * - tap flips and idle auto-return (FlipController)
 * - host configuration pushes (RotationArbiter)
 *
 * At most one of these writes the state at a time. A gesture begin, a tap,
 * an identity change or a mode change cancels whatever session or timer was
 * running before starting its own.
 *
 * Every change is committed to the attached Renderer together with an
 * AnimationHint and reported to the orientation listener. Until a renderer
 * is attached and has built a scene the controller is inert: input is
 * dropped and only the latest host configuration is kept, to be applied on
 * attach.
 *
 * Thread safety: Not thread-safe. All calls must come from one thread, which
 * serializes gestures, frame ticks and configuration pushes.
 */
class CardController
{
public:
  using OrientationListener = std::function<void(const Pose&)>;

  /**
   * @brief Construct a controller at rest
   * @param config Tuning; see ControllerConfig profiles
   * @param logger Logger for decisions and collaborator failures
   * @throws std::invalid_argument if config is invalid or logger is null
   */
  CardController(ControllerConfig config,
                 std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Attach the renderer and build the last known configuration
   * @param renderer Non-owning; must outlive the controller or be detached
   */
  void attachRenderer(Renderer& renderer);

  /// Cancel all sessions and forget the renderer and its scene
  void detachRenderer();

  /// Non-owning; nullptr disables haptics
  void setHapticsSink(HapticsSink* sink)
  {
    haptics_ = sink;
  }

  /**
   * @brief Receive every committed pose
   *
   * The listener may push a configuration back synchronously; a push that
   * echoes the committed pose is a no-op.
   */
  void setOrientationListener(OrientationListener listener)
  {
    listener_ = std::move(listener);
  }

  /**
   * @brief Apply a host configuration push
   *
   * Switches the interaction mode if it changed, then rebuilds, re-poses or
   * ignores according to the RotationArbiter.
   */
  void applyConfiguration(const HostConfiguration& config);

  /// Feed one sample of a drag gesture
  void handleDrag(const DragEvent& event);

  /// Feed a recognized tap
  void handleTap();

  /**
   * @brief Per-frame tick
   * @param deltaTime Time since the previous tick
   *
   * Runs due timers, then advances inertia by one step.
   */
  void update(std::chrono::milliseconds deltaTime);

  [[nodiscard]] const OrientationState& getOrientation() const
  {
    return state_;
  }

  [[nodiscard]] Pose getPose() const
  {
    return state_.toPose();
  }

  [[nodiscard]] bool isGestureActive() const
  {
    return gesture_.isActive();
  }

  [[nodiscard]] bool isInertiaActive() const
  {
    return inertia_.isActive();
  }

  [[nodiscard]] bool isIdleReturnPending() const
  {
    return flip_.isIdleReturnPending();
  }

  [[nodiscard]] bool isSettleCuePending() const
  {
    return flip_.isSettleCuePending();
  }

  /// Scene of the last successful rebuild; empty while inert
  [[nodiscard]] std::optional<SceneHandle> getSceneHandle() const
  {
    return scene_;
  }

  [[nodiscard]] InteractionMode getInteractionMode() const
  {
    return handler_.mode();
  }

  [[nodiscard]] const ControllerConfig& getConfig() const
  {
    return config_;
  }

  // Components hold references into this object
  CardController(const CardController&) = delete;
  CardController& operator=(const CardController&) = delete;
  CardController(CardController&&) = delete;
  CardController& operator=(CardController&&) = delete;
  ~CardController() = default;

private:
  [[nodiscard]] bool isLive() const
  {
    return renderer_ != nullptr && scene_.has_value();
  }

  [[nodiscard]] bool isSessionActive() const
  {
    return gesture_.isActive() || inertia_.isActive();
  }

  void switchMode(InteractionMode mode);
  void rebuild(const HostConfiguration& config, const Arbitration& arbitration);
  void repose(const Arbitration& arbitration);

  void beginDrag();
  void changeDrag(const DragEvent& event);
  void endDrag(const DragEvent& event);

  void onInteractionEnded();
  void returnToRest();
  void cancelSessions();

  void commit(const AnimationHint& hint);
  void emitCue(HapticCue cue);

  ControllerConfig config_;
  std::shared_ptr<spdlog::logger> logger_;

  OrientationState state_;
  TaskScheduler scheduler_;
  GestureTranslator gesture_;
  InertiaIntegrator inertia_;
  FlipController flip_;
  RotationArbiter arbiter_;
  InteractionHandler handler_;

  Renderer* renderer_{nullptr};
  HapticsSink* haptics_{nullptr};
  OrientationListener listener_;

  std::optional<HostConfiguration> latest_;
  std::optional<SceneHandle> scene_;
};

}  // namespace tilt_core

#endif  // TILT_CORE_CARD_CONTROLLER_HPP
