// Ticket: 0010_controller_bench

#include <benchmark/benchmark.h>
#include <chrono>

#include <Eigen/Dense>

#include "tilt-core/src/Animation/Easing.hpp"
#include "tilt-core/src/CardController.hpp"
#include "tilt-core/test/Helpers/Fakes.hpp"

using namespace tilt_core;
using namespace std::chrono_literals;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

HostConfiguration makeConfig()
{
  HostConfiguration config;
  config.identity =
    CardIdentity{"Jane Doe", "4532 1234 5678 9010", "12/28", "123"};
  return config;
}

// Drag far enough to break friction, then release with the given speed
void fling(CardController& controller, double speed)
{
  const Eigen::Vector2d translation{200.0, 40.0};
  controller.handleDrag(DragEvent{GesturePhase::Began});
  controller.handleDrag(DragEvent{GesturePhase::Changed, translation});
  controller.handleDrag(DragEvent{GesturePhase::Ended,
                                  translation,
                                  Eigen::Vector2d{speed, speed * 0.2}});
}

}  // namespace

// ============================================================================
// Easing
// ============================================================================

/**
 * @brief Cost of evaluating each easing curve at a fixed progress
 *
 * Renderers evaluate the curve once per frame per animated card.
 */
static void BM_Easing_Evaluate(benchmark::State& state)
{
  const Easing curves[] = {Easing::linear(),
                           Easing::easeOut(),
                           Easing::easeInOut(),
                           Easing::overshoot(),
                           Easing::spring()};
  const Easing& easing = curves[state.range(0)];

  double t = 0.0;
  for (auto _ : state)
  {
    t = (t >= 1.0) ? 0.0 : t + 0.013;
    double y = easing(t);
    benchmark::DoNotOptimize(y);
  }
}
BENCHMARK(BM_Easing_Evaluate)->DenseRange(0, 4);

// ============================================================================
// Controller
// ============================================================================

/**
 * @brief One full fling: drag, release, then frame ticks until inertia stops
 *
 * Arg is the release speed in points per second.
 */
static void BM_Controller_FlingToRest(benchmark::State& state)
{
  test::FakeRenderer renderer;
  CardController controller{ControllerConfig::freeRotation(),
                            test::makeNullLogger()};
  controller.attachRenderer(renderer);
  controller.applyConfiguration(makeConfig());

  const double speed = static_cast<double>(state.range(0));
  int64_t ticks = 0;
  for (auto _ : state)
  {
    fling(controller, speed);
    while (controller.isInertiaActive())
    {
      controller.update(16ms);
      ++ticks;
    }
    renderer.commits.clear();
  }
  state.counters["ticks_per_fling"] = benchmark::Counter(
    static_cast<double>(ticks), benchmark::Counter::kAvgIterations);
}
BENCHMARK(BM_Controller_FlingToRest)->Arg(500)->Arg(1500)->Arg(10000);

/**
 * @brief Host pushes that echo the current pose, the common steady state
 */
static void BM_Controller_EchoPush(benchmark::State& state)
{
  test::FakeRenderer renderer;
  CardController controller{ControllerConfig::freeRotation(),
                            test::makeNullLogger()};
  controller.attachRenderer(renderer);
  auto config = makeConfig();
  controller.applyConfiguration(config);
  config.externalYaw = controller.getPose().yaw;

  for (auto _ : state)
  {
    controller.applyConfiguration(config);
    benchmark::ClobberMemory();
  }
}
BENCHMARK(BM_Controller_EchoPush);

BENCHMARK_MAIN();
