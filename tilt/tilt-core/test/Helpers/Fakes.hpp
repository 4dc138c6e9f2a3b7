// Ticket: 0007_card_controller

#ifndef TILT_CORE_TEST_HELPERS_FAKES_HPP
#define TILT_CORE_TEST_HELPERS_FAKES_HPP

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "tilt-core/src/Collaborators/HapticsSink.hpp"
#include "tilt-core/src/Collaborators/Renderer.hpp"

namespace tilt_core::test
{

/// Logger that swallows everything, to keep test output clean
inline std::shared_ptr<spdlog::logger> makeNullLogger()
{
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("test_logger", sink);
  logger->set_level(spdlog::level::trace);
  return logger;
}

/**
 * @brief Renderer that records every call
 *
 * Set failNextRebuilds to make the next N rebuild() calls throw.
 */
class FakeRenderer final : public Renderer
{
public:
  struct Commit
  {
    Pose pose;
    AnimationHint hint;
  };

  void commitPose(const Pose& pose, const AnimationHint& hint) override
  {
    commits.push_back(Commit{pose, hint});
  }

  SceneHandle rebuild(const CardIdentity& identity,
                      const CardStyle& style,
                      const FieldVisibility& visibility) override
  {
    ++rebuildCalls;
    if (failNextRebuilds > 0)
    {
      --failNextRebuilds;
      throw std::runtime_error{"texture missing"};
    }
    lastIdentity = identity;
    lastStyle = style;
    lastVisibility = visibility;
    return SceneHandle{++nextScene};
  }

  [[nodiscard]] const Commit& lastCommit() const
  {
    return commits.back();
  }

  std::vector<Commit> commits;
  int rebuildCalls{0};
  int failNextRebuilds{0};
  uint64_t nextScene{0};
  CardIdentity lastIdentity;
  CardStyle lastStyle;
  FieldVisibility lastVisibility;
};

/// Haptics sink that records cues, optionally throwing on every emit
class RecordingHapticsSink final : public HapticsSink
{
public:
  void emit(HapticCue cue, double intensity) override
  {
    cues.push_back(cue);
    intensities.push_back(intensity);
    if (throwOnEmit)
    {
      throw std::runtime_error{"haptic engine stopped"};
    }
  }

  [[nodiscard]] int count(HapticCue cue) const
  {
    int n = 0;
    for (const auto c : cues)
    {
      n += (c == cue) ? 1 : 0;
    }
    return n;
  }

  std::vector<HapticCue> cues;
  std::vector<double> intensities;
  bool throwOnEmit{false};
};

}  // namespace tilt_core::test

#endif  // TILT_CORE_TEST_HELPERS_FAKES_HPP
