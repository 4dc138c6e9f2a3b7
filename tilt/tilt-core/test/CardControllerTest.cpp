// Ticket: 0007_card_controller

#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "tilt-core/src/CardController.hpp"
#include "tilt-core/test/Helpers/Fakes.hpp"

using namespace tilt_core;
using namespace tilt_core::test;
using namespace std::chrono_literals;

namespace
{

constexpr double ANGLE_TOLERANCE = 1e-9;
constexpr auto FRAME = 16ms;

HostConfiguration makeConfig()
{
  HostConfiguration config;
  config.identity =
    CardIdentity{"Jane Doe", "4532 1234 5678 9010", "12/28", "123"};
  config.style = CardStyle{CardStyle::Kind::OpaqueTextured, 1, {}};
  return config;
}

DragEvent dragEvent(GesturePhase phase,
                    Eigen::Vector2d translation = Eigen::Vector2d::Zero(),
                    Eigen::Vector2d velocity = Eigen::Vector2d::Zero())
{
  return DragEvent{phase, translation, velocity};
}

class CardControllerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    controller.setHapticsSink(&haptics);
    controller.attachRenderer(renderer);
    controller.applyConfiguration(makeConfig());
  }

  void dragTo(double dx, double dy = 0.0)
  {
    controller.handleDrag(dragEvent(GesturePhase::Began));
    controller.handleDrag(
      dragEvent(GesturePhase::Changed, Eigen::Vector2d{dx, dy}));
  }

  void release(double vx, double vy = 0.0)
  {
    controller.handleDrag(dragEvent(GesturePhase::Ended,
                                    Eigen::Vector2d::Zero(),
                                    Eigen::Vector2d{vx, vy}));
  }

  FakeRenderer renderer;
  RecordingHapticsSink haptics;
  CardController controller{ControllerConfig::freeRotation(),
                            makeNullLogger()};
};

}  // namespace

// ============================================================================
// Construction and rebuild
// ============================================================================

TEST(CardControllerConstructionTest, NullLogger_Throws)
{
  EXPECT_THROW(CardController(ControllerConfig::freeRotation(), nullptr),
               std::invalid_argument);
}

TEST(CardControllerConstructionTest, InvalidConfig_Throws)
{
  auto config = ControllerConfig::freeRotation();
  config.inertia.decayRate = 1.5;

  EXPECT_THROW(CardController(config, makeNullLogger()), std::invalid_argument);
}

TEST_F(CardControllerTest, FirstConfiguration_RebuildsOnceAndSnaps)
{
  EXPECT_EQ(renderer.rebuildCalls, 1);
  ASSERT_TRUE(controller.getSceneHandle().has_value());
  EXPECT_EQ(controller.getSceneHandle()->id, 1u);
  ASSERT_EQ(renderer.commits.size(), 1u);
  EXPECT_TRUE(renderer.lastCommit().hint.isSnap());
  EXPECT_EQ(renderer.lastCommit().pose, (Pose{0.0, 0.0, 1.0, false}));
  EXPECT_EQ(controller.getInteractionMode(), InteractionMode::FreeRotation);
}

TEST_F(CardControllerTest, RotationOnlyChange_ReposesWithoutRebuild)
{
  auto config = makeConfig();
  config.externalYaw = 0.3;
  config.scale = 0.9;
  config.animationDuration = 150ms;

  controller.applyConfiguration(config);

  EXPECT_EQ(renderer.rebuildCalls, 1);
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, 0.3);
  EXPECT_DOUBLE_EQ(controller.getPose().scale, 0.9);
  EXPECT_EQ(renderer.lastCommit().hint.duration, 150ms);
}

TEST_F(CardControllerTest, UnchangedConfiguration_NoCommit)
{
  const size_t before = renderer.commits.size();

  controller.applyConfiguration(makeConfig());

  EXPECT_EQ(renderer.commits.size(), before);
  EXPECT_EQ(renderer.rebuildCalls, 1);
}

TEST_F(CardControllerTest, IdentityChange_RebuildsOnceAndResets)
{
  controller.handleTap();
  ASSERT_TRUE(controller.getPose().isShowingBack);

  auto config = makeConfig();
  config.identity.cardNumber = "5500 0000 0000 0004";
  config.externalYaw = 0.2;
  controller.applyConfiguration(config);

  EXPECT_EQ(renderer.rebuildCalls, 2);
  EXPECT_EQ(renderer.lastIdentity.cardNumber, "5500 0000 0000 0004");
  EXPECT_FALSE(controller.getPose().isShowingBack);
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, 0.2);
  EXPECT_EQ(controller.getSceneHandle()->id, 2u);
}

TEST_F(CardControllerTest, StyleRebuildWhileBackShown_FaceFollowsSeededYaw)
{
  controller.handleTap();
  ASSERT_TRUE(controller.getPose().isShowingBack);

  auto config = makeConfig();
  config.style.design = 2;
  config.externalYaw = M_PI;
  controller.applyConfiguration(config);

  EXPECT_EQ(renderer.rebuildCalls, 2);
  EXPECT_TRUE(controller.getPose().isShowingBack);
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, M_PI);

  controller.handleTap();

  EXPECT_FALSE(controller.getPose().isShowingBack);
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, 0.0);
}

TEST_F(CardControllerTest, RebuildWithYawNearPi_IdleReturnSettlesOnBack)
{
  auto config = makeConfig();
  config.style.design = 3;
  config.externalYaw = 3.0;
  controller.applyConfiguration(config);
  ASSERT_EQ(renderer.rebuildCalls, 2);
  ASSERT_TRUE(controller.getPose().isShowingBack);

  dragTo(100.0);
  release(0.0);
  ASSERT_TRUE(controller.isIdleReturnPending());

  controller.update(2000ms);

  EXPECT_TRUE(controller.getPose().isShowingBack);
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, M_PI);
}

TEST_F(CardControllerTest, ReposeToZeroWhileBackShown_ShowsFront)
{
  controller.handleTap();
  ASSERT_TRUE(controller.getPose().isShowingBack);

  auto config = makeConfig();
  config.externalYaw = 0.0;
  controller.applyConfiguration(config);

  EXPECT_EQ(renderer.rebuildCalls, 1);
  EXPECT_FALSE(controller.getPose().isShowingBack);
  EXPECT_FALSE(renderer.lastCommit().pose.isShowingBack);

  controller.handleTap();

  EXPECT_TRUE(controller.getPose().isShowingBack);
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, M_PI);
}

TEST_F(CardControllerTest, StyleChange_CancelsInertiaAndPendingSettleCue)
{
  controller.handleTap();
  ASSERT_TRUE(controller.isSettleCuePending());

  auto config = makeConfig();
  config.style.design = 3;
  controller.applyConfiguration(config);
  controller.update(1000ms);

  EXPECT_FALSE(controller.isSettleCuePending());
  EXPECT_EQ(haptics.count(HapticCue::SettleComplete), 0);
}

// ============================================================================
// Drag
// ============================================================================

TEST_F(CardControllerTest, Drag200Units_Yaw2Point4BeforeRelease)
{
  dragTo(200.0);

  EXPECT_TRUE(controller.isGestureActive());
  EXPECT_NEAR(controller.getPose().yaw, 2.4, ANGLE_TOLERANCE);
  EXPECT_EQ(renderer.lastCommit().hint.duration, 80ms);
  EXPECT_EQ(renderer.lastCommit().hint.easing, Easing::easeOut());
  EXPECT_EQ(haptics.count(HapticCue::GestureStart), 1);
  EXPECT_EQ(haptics.count(HapticCue::FrictionBreak), 1);
  EXPECT_EQ(haptics.count(HapticCue::RotationTick), 1);
}

TEST_F(CardControllerTest, VerticalDrag_PitchStaysInBand)
{
  dragTo(0.0, -5000.0);

  EXPECT_DOUBLE_EQ(controller.getPose().pitch, 0.15);
}

TEST_F(CardControllerTest, Release1500_Inertia67UpdatesThenIdleReturn)
{
  dragTo(200.0);
  release(1500.0);
  ASSERT_TRUE(controller.isInertiaActive());
  EXPECT_FALSE(controller.isGestureActive());
  EXPECT_EQ(haptics.count(HapticCue::Release), 1);

  for (int tick = 1; tick <= 66; ++tick)
  {
    controller.update(FRAME);
    ASSERT_TRUE(controller.isInertiaActive()) << "tick " << tick;
  }
  controller.update(FRAME);
  EXPECT_FALSE(controller.isInertiaActive());
  EXPECT_TRUE(controller.isIdleReturnPending());
  EXPECT_GT(controller.getPose().yaw, 2.4 + 0.5);

  controller.update(2000ms);

  EXPECT_DOUBLE_EQ(controller.getPose().yaw, 0.0);
  EXPECT_EQ(renderer.lastCommit().hint.duration, 300ms);
  EXPECT_EQ(renderer.lastCommit().hint.easing.kind(), Easing::Kind::Spring);
}

TEST_F(CardControllerTest, SlowRelease_NoInertiaAutoReturnAfterDelay)
{
  dragTo(100.0);
  release(10.0);

  EXPECT_FALSE(controller.isInertiaActive());
  EXPECT_TRUE(controller.isIdleReturnPending());

  controller.update(1999ms);
  EXPECT_NEAR(controller.getPose().yaw, 1.2, ANGLE_TOLERANCE);

  controller.update(1ms);
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, 0.0);
}

TEST_F(CardControllerTest, GestureBegin_PreemptsInertiaAndIdleTimer)
{
  dragTo(200.0);
  release(1500.0);
  controller.update(FRAME);
  ASSERT_TRUE(controller.isInertiaActive());

  controller.handleDrag(dragEvent(GesturePhase::Began));

  EXPECT_FALSE(controller.isInertiaActive());
  EXPECT_FALSE(controller.isIdleReturnPending());
  EXPECT_TRUE(controller.isGestureActive());
}

TEST_F(CardControllerTest, ReleaseWithoutFrictionBreak_NoReleaseCue)
{
  dragTo(3.0);
  release(0.0);

  EXPECT_EQ(haptics.count(HapticCue::Release), 0);
}

// ============================================================================
// Tap and flip
// ============================================================================

TEST_F(CardControllerTest, Tap_FlipsToPiThenBackToZero)
{
  controller.handleTap();
  EXPECT_TRUE(controller.getPose().isShowingBack);
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, M_PI);
  EXPECT_EQ(renderer.lastCommit().hint.duration, 500ms);
  EXPECT_EQ(renderer.lastCommit().hint.easing, Easing::overshoot());

  controller.handleTap();
  EXPECT_FALSE(controller.getPose().isShowingBack);
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, 0.0);
  EXPECT_EQ(haptics.count(HapticCue::Flip), 2);
}

TEST_F(CardControllerTest, Tap_SettleCueFires400msLater)
{
  controller.handleTap();

  controller.update(399ms);
  EXPECT_EQ(haptics.count(HapticCue::SettleComplete), 0);

  controller.update(1ms);
  EXPECT_EQ(haptics.count(HapticCue::SettleComplete), 1);
}

TEST_F(CardControllerTest, TapDuringSubThresholdDrag_FlipWins)
{
  dragTo(5.0);
  ASSERT_GT(controller.getPose().yaw, 0.0);

  controller.handleTap();

  EXPECT_FALSE(controller.isGestureActive());
  EXPECT_TRUE(controller.getPose().isShowingBack);
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, M_PI);
}

TEST_F(CardControllerTest, TapAfterFrictionBroke_Ignored)
{
  dragTo(50.0);

  controller.handleTap();

  EXPECT_TRUE(controller.isGestureActive());
  EXPECT_FALSE(controller.getPose().isShowingBack);
  EXPECT_NEAR(controller.getPose().yaw, 0.6, ANGLE_TOLERANCE);
}

TEST_F(CardControllerTest, TapDuringInertia_CancelsInertia)
{
  dragTo(200.0);
  release(1500.0);

  controller.handleTap();

  EXPECT_FALSE(controller.isInertiaActive());
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, M_PI);
}

// ============================================================================
// External pushes during sessions
// ============================================================================

TEST_F(CardControllerTest, ExternalRotationDuringInertia_Ignored)
{
  dragTo(200.0);
  release(1500.0);
  controller.update(FRAME);
  const double yawBefore = controller.getPose().yaw;

  auto config = makeConfig();
  config.externalYaw = 1.0;
  controller.applyConfiguration(config);

  EXPECT_DOUBLE_EQ(controller.getPose().yaw, yawBefore);
  EXPECT_TRUE(controller.isInertiaActive());

  controller.update(FRAME);
  EXPECT_GT(controller.getPose().yaw, yawBefore);
}

TEST_F(CardControllerTest, ScaleDuringDrag_Applied)
{
  dragTo(200.0);

  auto config = makeConfig();
  config.externalYaw = 0.0;
  config.scale = 0.85;
  controller.applyConfiguration(config);

  EXPECT_DOUBLE_EQ(controller.getPose().scale, 0.85);
  EXPECT_NEAR(controller.getPose().yaw, 2.4, ANGLE_TOLERANCE);
  EXPECT_TRUE(controller.isGestureActive());
}

TEST_F(CardControllerTest, ExternalRotation_CancelsIdleReturn)
{
  dragTo(100.0);
  release(0.0);
  ASSERT_TRUE(controller.isIdleReturnPending());

  auto config = makeConfig();
  config.externalYaw = 0.5;
  controller.applyConfiguration(config);

  EXPECT_FALSE(controller.isIdleReturnPending());
  controller.update(3000ms);
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, 0.5);
}

TEST_F(CardControllerTest, ListenerEcho_IsNoop)
{
  std::vector<Pose> poses;
  controller.setOrientationListener(
    [this, &poses](const Pose& pose)
    {
      poses.push_back(pose);
      auto config = makeConfig();
      config.externalYaw = pose.yaw;
      config.externalPitch = pose.pitch;
      config.scale = pose.scale;
      controller.applyConfiguration(config);
    });
  const size_t before = renderer.commits.size();

  controller.handleTap();

  ASSERT_EQ(poses.size(), 1u);
  EXPECT_DOUBLE_EQ(poses.back().yaw, M_PI);
  EXPECT_TRUE(poses.back().isShowingBack);
  EXPECT_EQ(renderer.commits.size(), before + 1);
}

// ============================================================================
// Interaction modes
// ============================================================================

TEST_F(CardControllerTest, TapOnlyMode_IgnoresDrags)
{
  auto config = makeConfig();
  config.interactionMode = InteractionMode::TapOnly;
  controller.applyConfiguration(config);

  dragTo(200.0);
  EXPECT_FALSE(controller.isGestureActive());
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, 0.0);

  controller.handleTap();
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, M_PI);
}

TEST_F(CardControllerTest, DisabledMode_IgnoresAllInput)
{
  auto config = makeConfig();
  config.interactionMode = InteractionMode::Disabled;
  controller.applyConfiguration(config);

  dragTo(200.0);
  controller.handleTap();

  EXPECT_EQ(controller.getPose(), (Pose{0.0, 0.0, 1.0, false}));
  EXPECT_EQ(renderer.rebuildCalls, 1);
}

TEST_F(CardControllerTest, ModeChange_CancelsSessionsKeepsOrientation)
{
  dragTo(200.0);
  release(1500.0);
  controller.update(FRAME);
  const Pose before = controller.getPose();

  auto config = makeConfig();
  config.interactionMode = InteractionMode::TapOnly;
  controller.applyConfiguration(config);

  EXPECT_FALSE(controller.isInertiaActive());
  EXPECT_EQ(controller.getPose(), before);
  EXPECT_EQ(controller.getInteractionMode(), InteractionMode::TapOnly);
}

// ============================================================================
// Collaborator failures
// ============================================================================

TEST(CardControllerCollaboratorTest, NoRenderer_DropsInputAndBuildsOnAttach)
{
  FakeRenderer renderer;
  CardController controller{ControllerConfig::freeRotation(),
                            makeNullLogger()};

  controller.applyConfiguration(makeConfig());
  controller.handleTap();
  controller.handleDrag(
    dragEvent(GesturePhase::Began, Eigen::Vector2d::Zero()));
  controller.update(FRAME);

  EXPECT_FALSE(controller.getSceneHandle().has_value());
  EXPECT_FALSE(controller.getPose().isShowingBack);
  EXPECT_FALSE(controller.isGestureActive());

  controller.attachRenderer(renderer);

  EXPECT_EQ(renderer.rebuildCalls, 1);
  EXPECT_TRUE(controller.getSceneHandle().has_value());
  EXPECT_EQ(renderer.commits.size(), 1u);
}

TEST(CardControllerCollaboratorTest, RebuildFailure_InertUntilNextRebuild)
{
  FakeRenderer renderer;
  renderer.failNextRebuilds = 1;
  CardController controller{ControllerConfig::freeRotation(),
                            makeNullLogger()};
  controller.attachRenderer(renderer);

  controller.applyConfiguration(makeConfig());
  EXPECT_FALSE(controller.getSceneHandle().has_value());

  controller.handleTap();
  EXPECT_FALSE(controller.getPose().isShowingBack);
  EXPECT_TRUE(renderer.commits.empty());

  controller.applyConfiguration(makeConfig());
  EXPECT_EQ(renderer.rebuildCalls, 2);
  EXPECT_TRUE(controller.getSceneHandle().has_value());

  controller.handleTap();
  EXPECT_TRUE(controller.getPose().isShowingBack);
}

TEST(CardControllerCollaboratorTest, ThrowingHapticsSink_StateUnaffected)
{
  FakeRenderer renderer;
  RecordingHapticsSink haptics;
  haptics.throwOnEmit = true;
  CardController controller{ControllerConfig::freeRotation(),
                            makeNullLogger()};
  controller.setHapticsSink(&haptics);
  controller.attachRenderer(renderer);
  controller.applyConfiguration(makeConfig());

  EXPECT_NO_THROW(controller.handleTap());

  EXPECT_TRUE(controller.getPose().isShowingBack);
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, M_PI);
  EXPECT_EQ(haptics.count(HapticCue::Flip), 1);
}

TEST(CardControllerCollaboratorTest, DetachRenderer_StopsInertiaAndDropsInput)
{
  FakeRenderer renderer;
  CardController controller{ControllerConfig::freeRotation(),
                            makeNullLogger()};
  controller.attachRenderer(renderer);
  controller.applyConfiguration(makeConfig());
  controller.handleDrag(dragEvent(GesturePhase::Began));
  controller.handleDrag(
    dragEvent(GesturePhase::Changed, Eigen::Vector2d{200.0, 0.0}));
  controller.handleDrag(dragEvent(GesturePhase::Ended,
                                  Eigen::Vector2d{200.0, 0.0},
                                  Eigen::Vector2d{1500.0, 0.0}));
  ASSERT_TRUE(controller.isInertiaActive());

  controller.detachRenderer();
  const size_t commits = renderer.commits.size();
  controller.update(FRAME);
  controller.handleTap();

  EXPECT_FALSE(controller.isInertiaActive());
  EXPECT_FALSE(controller.getSceneHandle().has_value());
  EXPECT_EQ(renderer.commits.size(), commits);
}

// ============================================================================
// Profiles
// ============================================================================

TEST(CardControllerProfileTest, LegacyFriction_YawClampedAndNoTilt)
{
  FakeRenderer renderer;
  CardController controller{ControllerConfig::legacyFriction(),
                            makeNullLogger()};
  controller.attachRenderer(renderer);
  controller.applyConfiguration(makeConfig());

  controller.handleDrag(dragEvent(GesturePhase::Began));
  controller.handleDrag(
    dragEvent(GesturePhase::Changed, Eigen::Vector2d{500.0, -300.0}));

  EXPECT_NEAR(controller.getPose().yaw, M_PI * 1.11, ANGLE_TOLERANCE);
  EXPECT_DOUBLE_EQ(controller.getPose().pitch, 0.0);

  controller.handleDrag(dragEvent(GesturePhase::Ended,
                                  Eigen::Vector2d{500.0, -300.0},
                                  Eigen::Vector2d{5000.0, 0.0}));
  while (controller.isInertiaActive())
  {
    controller.update(FRAME);
  }
  EXPECT_NEAR(controller.getPose().yaw, M_PI * 1.11, ANGLE_TOLERANCE);

  controller.update(1500ms);
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, 0.0);
  EXPECT_EQ(renderer.lastCommit().hint.easing, Easing::easeInOut());
}

TEST(CardControllerProfileTest, TapOnly_NeverReturnsOnItsOwn)
{
  FakeRenderer renderer;
  CardController controller{ControllerConfig::tapOnly(), makeNullLogger()};
  controller.attachRenderer(renderer);
  auto config = makeConfig();
  config.interactionMode = InteractionMode::TapOnly;
  controller.applyConfiguration(config);

  controller.handleTap();
  controller.update(10000ms);

  EXPECT_FALSE(controller.isIdleReturnPending());
  EXPECT_DOUBLE_EQ(controller.getPose().yaw, M_PI);
}
