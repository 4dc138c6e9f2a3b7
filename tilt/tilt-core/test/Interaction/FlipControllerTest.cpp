// Ticket: 0004_flip_controller

#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <stdexcept>

#include "tilt-core/src/DataTypes/OrientationState.hpp"
#include "tilt-core/src/Interaction/FlipController.hpp"
#include "tilt-core/src/Scheduling/TaskScheduler.hpp"

using namespace tilt_core;
using namespace std::chrono_literals;

// ============================================================================
// Flip
// ============================================================================

TEST(FlipControllerTest, Flip_FromFront_TargetsPi)
{
  TaskScheduler scheduler;
  FlipController flip{scheduler};
  OrientationState state;
  state.setPitch(0.1);

  const AnimationHint hint = flip.flip(state, {});

  EXPECT_TRUE(state.isShowingBack());
  EXPECT_DOUBLE_EQ(state.yaw(), M_PI);
  EXPECT_DOUBLE_EQ(state.pitch(), 0.0);
  EXPECT_EQ(hint.duration, 500ms);
  EXPECT_EQ(hint.easing, Easing::overshoot());
}

TEST(FlipControllerTest, Flip_Twice_ReturnsToZeroNotTwoPi)
{
  TaskScheduler scheduler;
  FlipController flip{scheduler};
  OrientationState state;

  flip.flip(state, {});
  flip.flip(state, {});

  EXPECT_FALSE(state.isShowingBack());
  EXPECT_DOUBLE_EQ(state.yaw(), 0.0);
}

TEST(FlipControllerTest, Flip_AfterLargeDrag_TargetsAbsoluteRest)
{
  TaskScheduler scheduler;
  FlipController flip{scheduler};
  OrientationState state;
  state.setYaw(7.3);

  flip.flip(state, {});

  EXPECT_DOUBLE_EQ(state.yaw(), M_PI);
}

TEST(FlipControllerTest, Flip_SchedulesSettleCueBeforeAnimationEnds)
{
  TaskScheduler scheduler;
  FlipController flip{scheduler};
  OrientationState state;
  int settled = 0;

  flip.flip(state, [&settled]() { ++settled; });
  EXPECT_TRUE(flip.isSettleCuePending());

  scheduler.advance(399ms);
  EXPECT_EQ(settled, 0);

  scheduler.advance(1ms);
  EXPECT_EQ(settled, 1);
  EXPECT_FALSE(flip.isSettleCuePending());
}

TEST(FlipControllerTest, Flip_CancelsPendingTimers)
{
  TaskScheduler scheduler;
  FlipController flip{scheduler};
  OrientationState state;
  int settled = 0;
  bool idled = false;

  flip.armIdleReturn([&idled]() { idled = true; });
  flip.flip(state, [&settled]() { ++settled; });
  flip.flip(state, [&settled]() { ++settled; });

  scheduler.advance(5000ms);

  EXPECT_FALSE(idled);
  EXPECT_EQ(settled, 1);
}

// ============================================================================
// Idle return
// ============================================================================

TEST(FlipControllerTest, ArmIdleReturn_FiresAfterDelay)
{
  TaskScheduler scheduler;
  FlipController flip{scheduler};
  bool idled = false;

  EXPECT_TRUE(flip.armIdleReturn([&idled]() { idled = true; }));

  scheduler.advance(1999ms);
  EXPECT_FALSE(idled);
  EXPECT_TRUE(flip.isIdleReturnPending());

  scheduler.advance(1ms);
  EXPECT_TRUE(idled);
  EXPECT_FALSE(flip.isIdleReturnPending());
}

TEST(FlipControllerTest, ArmIdleReturn_Rearm_RestartsDelay)
{
  TaskScheduler scheduler;
  FlipController flip{scheduler};
  int idled = 0;

  flip.armIdleReturn([&idled]() { ++idled; });
  scheduler.advance(1500ms);
  flip.armIdleReturn([&idled]() { ++idled; });
  scheduler.advance(1500ms);
  EXPECT_EQ(idled, 0);

  scheduler.advance(500ms);
  EXPECT_EQ(idled, 1);
}

TEST(FlipControllerTest, ArmIdleReturn_Disabled_ReturnsFalse)
{
  TaskScheduler scheduler;
  FlipController::Config config;
  config.idleReturnDelay.reset();
  FlipController flip{scheduler, config};

  EXPECT_FALSE(flip.armIdleReturn([]() {}));
  EXPECT_EQ(scheduler.pendingCount(), 0u);
}

TEST(FlipControllerTest, CancelIdleReturn_PreventsCallback)
{
  TaskScheduler scheduler;
  FlipController flip{scheduler};
  bool idled = false;

  flip.armIdleReturn([&idled]() { idled = true; });
  flip.cancelIdleReturn();
  scheduler.advance(3000ms);

  EXPECT_FALSE(idled);
}

TEST(FlipControllerTest, ReturnToRest_KeepsFaceAndUsesSpring)
{
  TaskScheduler scheduler;
  FlipController flip{scheduler};
  OrientationState state;
  state.setShowingBack(true);
  state.setYaw(2.0);
  state.setPitch(-0.1);

  const AnimationHint hint = flip.returnToRest(state);

  EXPECT_TRUE(state.isShowingBack());
  EXPECT_DOUBLE_EQ(state.yaw(), M_PI);
  EXPECT_DOUBLE_EQ(state.pitch(), 0.0);
  EXPECT_EQ(hint.duration, 300ms);
  EXPECT_EQ(hint.easing.kind(), Easing::Kind::Spring);
}

TEST(FlipControllerTest, Constructor_NegativeDuration_Throws)
{
  TaskScheduler scheduler;
  FlipController::Config config;
  config.settleDuration = -1ms;

  EXPECT_THROW(FlipController(scheduler, config), std::invalid_argument);
}
