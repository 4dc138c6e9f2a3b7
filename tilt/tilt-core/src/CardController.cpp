// Ticket: 0007_card_controller

#include "tilt-core/src/CardController.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace tilt_core
{

namespace
{

ControllerConfig validated(ControllerConfig config)
{
  config.validate();
  return config;
}

}  // namespace

CardController::CardController(ControllerConfig config,
                               std::shared_ptr<spdlog::logger> logger)
  : config_{validated(std::move(config))},
    logger_{std::move(logger)},
    state_{config_.maxTilt},
    gesture_{config_.gesture},
    inertia_{config_.inertia},
    flip_{scheduler_, config_.flip},
    arbiter_{config_.arbiter, logger_}
{
  if (config_.gesture.yawLimit)
  {
    inertia_.setYawLimiter([this](double yaw)
                           { return gesture_.limitYaw(yaw); });
  }
}

void CardController::attachRenderer(Renderer& renderer)
{
  renderer_ = &renderer;
  scene_.reset();
  arbiter_.invalidate();
  logger_->info("Renderer attached");

  if (latest_)
  {
    const HostConfiguration pending = *latest_;
    applyConfiguration(pending);
  }
}

void CardController::detachRenderer()
{
  cancelSessions();
  renderer_ = nullptr;
  scene_.reset();
  arbiter_.invalidate();
  logger_->info("Renderer detached");
}

void CardController::applyConfiguration(const HostConfiguration& config)
{
  latest_ = config;

  if (renderer_ == nullptr)
  {
    logger_->debug("No renderer attached, configuration stored");
    return;
  }

  if (!handler_.isAttached() || handler_.mode() != config.interactionMode)
  {
    switchMode(config.interactionMode);
  }

  const Arbitration arbitration =
    arbiter_.arbitrate(config, state_, isSessionActive());
  logger_->debug("Configuration push: {}", toString(arbitration.decision));

  switch (arbitration.decision)
  {
    case RebuildDecision::FullRebuild:
      rebuild(config, arbitration);
      break;
    case RebuildDecision::Repose:
      repose(arbitration);
      break;
    case RebuildDecision::Noop:
      break;
  }
}

void CardController::handleDrag(const DragEvent& event)
{
  if (!isLive())
  {
    logger_->debug("Drag dropped: no scene");
    return;
  }
  if (!handler_.acceptsDrag())
  {
    logger_->trace("Drag ignored in {} mode", handler_.mode());
    return;
  }

  switch (event.phase)
  {
    case GesturePhase::Began:
      beginDrag();
      break;
    case GesturePhase::Changed:
      changeDrag(event);
      break;
    case GesturePhase::Ended:
    case GesturePhase::Cancelled:
      endDrag(event);
      break;
  }
}

void CardController::handleTap()
{
  if (!isLive())
  {
    logger_->debug("Tap dropped: no scene");
    return;
  }
  if (!handler_.acceptsTap())
  {
    logger_->trace("Tap ignored in {} mode", handler_.mode());
    return;
  }

  if (const auto& session = gesture_.session())
  {
    if (session->hasBrokenFriction)
    {
      logger_->debug("Tap ignored: drag already rotating");
      return;
    }
    // The pointer never really dragged; undo the friction-damped motion
    state_.setYaw(session->originYaw);
    state_.setPitch(session->originPitch);
    gesture_.discard();
  }
  inertia_.cancel();

  const AnimationHint hint =
    flip_.flip(state_, [this]() { emitCue(HapticCue::SettleComplete); });
  emitCue(HapticCue::Flip);
  commit(hint);
}

void CardController::update(std::chrono::milliseconds deltaTime)
{
  if (!isLive())
  {
    return;
  }

  scheduler_.advance(deltaTime);

  if (inertia_.isActive())
  {
    const bool stillActive = inertia_.step(state_);
    commit(AnimationHint::snap());
    if (!stillActive)
    {
      onInteractionEnded();
    }
  }
}

void CardController::switchMode(InteractionMode mode)
{
  if (handler_.isAttached())
  {
    logger_->info("Interaction mode {} -> {}", handler_.mode(), mode);
    handler_.detach();
  }
  else
  {
    logger_->info("Interaction mode {}", mode);
  }
  cancelSessions();
  handler_.attach(mode);
}

void CardController::rebuild(const HostConfiguration& config,
                             const Arbitration& arbitration)
{
  cancelSessions();

  try
  {
    scene_ = renderer_->rebuild(config.identity, config.style, config.visibility);
  }
  catch (const std::exception& e)
  {
    scene_.reset();
    arbiter_.invalidate();
    logger_->error("Scene rebuild failed: {}", e.what());
    return;
  }
  arbiter_.markRebuilt(config);

  state_.reset();
  state_.setYaw(arbitration.targets.yaw.value_or(0.0));
  state_.setPitch(arbitration.targets.pitch.value_or(0.0));
  state_.setScale(arbitration.targets.scale.value_or(1.0));
  state_.matchFaceToYaw();

  logger_->debug("Scene {} built at {}", scene_->id, state_.toPose());
  commit(AnimationHint::snap());
}

void CardController::repose(const Arbitration& arbitration)
{
  const ExternalTargets& targets = arbitration.targets;

  if (targets.yaw || targets.pitch)
  {
    // The host takes over; a pending return would fight it
    flip_.cancelIdleReturn();
  }
  if (targets.yaw)
  {
    state_.setYaw(*targets.yaw);
    state_.matchFaceToYaw();
  }
  if (targets.pitch)
  {
    state_.setPitch(*targets.pitch);
  }
  if (targets.scale)
  {
    state_.setScale(*targets.scale);
  }

  commit(AnimationHint{arbitration.animationDuration, Easing::easeInOut()});
}

void CardController::beginDrag()
{
  inertia_.cancel();
  flip_.cancelAll();
  gesture_.begin(state_);
  emitCue(HapticCue::GestureStart);
}

void CardController::changeDrag(const DragEvent& event)
{
  if (!gesture_.isActive())
  {
    return;
  }

  const auto outcome =
    gesture_.change(state_, event.translation, scheduler_.now());
  if (!outcome.applied)
  {
    logger_->debug("Rejected drag translation ({}, {})",
                   event.translation.x(),
                   event.translation.y());
    return;
  }

  if (outcome.brokeFriction)
  {
    emitCue(HapticCue::FrictionBreak);
  }
  if (outcome.rotationTick)
  {
    emitCue(HapticCue::RotationTick);
  }
  commit(gesture_.dragHint());
}

void CardController::endDrag(const DragEvent& event)
{
  const auto& session = gesture_.session();
  if (!session)
  {
    return;
  }

  const bool wasRotating = session->hasBrokenFriction;
  const AngularVelocity omega = gesture_.end(event.velocity);

  if (wasRotating)
  {
    emitCue(HapticCue::Release);
  }

  if (inertia_.start(omega))
  {
    logger_->debug("Inertia started at {}", omega);
  }
  else
  {
    onInteractionEnded();
  }
}

void CardController::onInteractionEnded()
{
  flip_.armIdleReturn([this]() { returnToRest(); });
}

void CardController::returnToRest()
{
  if (isSessionActive())
  {
    return;
  }
  commit(flip_.returnToRest(state_));
}

void CardController::cancelSessions()
{
  gesture_.discard();
  inertia_.cancel();
  flip_.cancelAll();
}

void CardController::commit(const AnimationHint& hint)
{
  const Pose pose = state_.toPose();
  if (renderer_ != nullptr)
  {
    renderer_->commitPose(pose, hint);
  }
  if (listener_)
  {
    listener_(pose);
  }
}

void CardController::emitCue(HapticCue cue)
{
  if (haptics_ == nullptr)
  {
    return;
  }

  try
  {
    haptics_->emit(cue, defaultIntensity(cue));
  }
  catch (const std::exception& e)
  {
    logger_->warn("Haptics sink failed on {}: {}", cue, e.what());
  }
}

}  // namespace tilt_core
