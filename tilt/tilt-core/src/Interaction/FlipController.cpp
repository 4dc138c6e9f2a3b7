// Ticket: 0004_flip_controller

#include "tilt-core/src/Interaction/FlipController.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tilt_core
{

void FlipController::Config::validate() const
{
  if (settleDuration.count() < 0)
  {
    throw std::invalid_argument(
      "FlipController::Config: settleDuration must not be negative");
  }
  if (idleReturnDelay && idleReturnDelay->count() < 0)
  {
    throw std::invalid_argument(
      "FlipController::Config: idleReturnDelay must not be negative");
  }
  if (returnDuration.count() < 0)
  {
    throw std::invalid_argument(
      "FlipController::Config: returnDuration must not be negative");
  }
  if (settleCueLead.count() < 0)
  {
    throw std::invalid_argument(
      "FlipController::Config: settleCueLead must not be negative");
  }
}

FlipController::FlipController(TaskScheduler& scheduler, Config config)
  : scheduler_{scheduler}, config_{std::move(config)}
{
  config_.validate();
}

AnimationHint FlipController::flip(OrientationState& state, Callback onSettled)
{
  cancelAll();

  state.toggleFace();
  state.setYaw(state.restYaw());
  state.setPitch(0.0);

  if (onSettled)
  {
    const auto cueAt = std::max(config_.settleDuration - config_.settleCueLead,
                                std::chrono::milliseconds{0});
    settleHandle_ = scheduler_.schedule(
      cueAt,
      [this, callback = std::move(onSettled)]()
      {
        settleHandle_ = TaskScheduler::kInvalidHandle;
        callback();
      });
  }

  return AnimationHint{config_.settleDuration, config_.settleEasing};
}

bool FlipController::armIdleReturn(Callback onIdle)
{
  cancelIdleReturn();
  if (!config_.idleReturnDelay || !onIdle)
  {
    return false;
  }

  idleHandle_ = scheduler_.schedule(*config_.idleReturnDelay,
                                    [this, callback = std::move(onIdle)]()
                                    {
                                      idleHandle_ =
                                        TaskScheduler::kInvalidHandle;
                                      callback();
                                    });
  return true;
}

AnimationHint FlipController::returnToRest(OrientationState& state) const
{
  state.setYaw(state.restYaw());
  state.setPitch(0.0);
  return AnimationHint{config_.returnDuration, config_.returnEasing};
}

void FlipController::cancelIdleReturn()
{
  if (idleHandle_ != TaskScheduler::kInvalidHandle)
  {
    scheduler_.cancel(idleHandle_);
    idleHandle_ = TaskScheduler::kInvalidHandle;
  }
}

void FlipController::cancelSettleCue()
{
  if (settleHandle_ != TaskScheduler::kInvalidHandle)
  {
    scheduler_.cancel(settleHandle_);
    settleHandle_ = TaskScheduler::kInvalidHandle;
  }
}

bool FlipController::isIdleReturnPending() const
{
  return idleHandle_ != TaskScheduler::kInvalidHandle &&
         scheduler_.isPending(idleHandle_);
}

bool FlipController::isSettleCuePending() const
{
  return settleHandle_ != TaskScheduler::kInvalidHandle &&
         scheduler_.isPending(settleHandle_);
}

}  // namespace tilt_core
