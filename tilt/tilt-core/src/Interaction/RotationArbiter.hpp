// Ticket: 0006_rotation_arbiter

#ifndef TILT_CORE_INTERACTION_ROTATION_ARBITER_HPP
#define TILT_CORE_INTERACTION_ROTATION_ARBITER_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

#include "tilt-core/src/DataTypes/CardConfiguration.hpp"
#include "tilt-core/src/DataTypes/OrientationState.hpp"

namespace tilt_core
{

enum class RebuildDecision : uint8_t
{
  Noop,        // Nothing observable changed
  Repose,      // Only rotation/scale changed
  FullRebuild  // Identity, style or field visibility changed
};

constexpr std::string_view toString(RebuildDecision decision)
{
  switch (decision)
  {
    case RebuildDecision::Noop:
      return "Noop";
    case RebuildDecision::Repose:
      return "Repose";
    case RebuildDecision::FullRebuild:
      return "FullRebuild";
  }
  return "Unknown";
}

/**
 * @brief External values that survived validation and should be applied
 *
 * An empty field means "leave the state alone" for a repose and "back to
 * rest" for a rebuild.
 */
struct ExternalTargets
{
  std::optional<double> yaw;
  std::optional<double> pitch;  // Already clamped to the tilt band
  std::optional<double> scale;

  [[nodiscard]] bool empty() const
  {
    return !yaw && !pitch && !scale;
  }
};

struct Arbitration
{
  RebuildDecision decision{RebuildDecision::Noop};
  ExternalTargets targets;
  std::chrono::milliseconds animationDuration{0};
};

/**
 * @brief Merges host configuration pushes with locally driven orientation
 *
 * Decides per push whether the scene must be rebuilt, re-posed or left
 * alone. The arbiter remembers the appearance (identity, style, visibility)
 * of the last successfully built scene; until markRebuilt() has been called
 * every push asks for a full rebuild, so a failed rebuild is retried on the
 * next push.
 *
 * External values are validated field by field. A rejected field keeps the
 * state's current value and is logged at debug level.
 *
 * Thread safety: Not thread-safe
 */
class RotationArbiter
{
public:
  struct Config
  {
    double rotationEpsilon{0.001};  // [rad]
    double scaleEpsilon{0.001};

    /// Used when a push carries a non-positive animation duration
    std::chrono::milliseconds defaultAnimationDuration{150};

    /// @throws std::invalid_argument naming the offending field
    void validate() const;
  };

  /**
   * @param config Tolerances
   * @param logger Destination for decision logs (must not be null)
   * @throws std::invalid_argument if the config is invalid or the logger is
   *         null
   */
  RotationArbiter(Config config, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Decide how to apply a configuration push
   * @param incoming Host configuration
   * @param state Current orientation (read only)
   * @param sessionActive True while a gesture or inertia session runs;
   *        external rotation is then ignored but scale still applies
   */
  Arbitration arbitrate(const HostConfiguration& incoming,
                        const OrientationState& state,
                        bool sessionActive) const;

  /// Record the appearance of a successfully built scene
  void markRebuilt(const HostConfiguration& applied);

  /// Forget the built scene; the next push rebuilds
  void invalidate();

  [[nodiscard]] bool hasScene() const
  {
    return built_.has_value();
  }

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

private:
  struct Appearance
  {
    CardIdentity identity;
    CardStyle style;
    FieldVisibility visibility;

    bool operator==(const Appearance&) const = default;
  };

  static Appearance appearanceOf(const HostConfiguration& config);

  ExternalTargets sanitize(const HostConfiguration& incoming,
                           const OrientationState& state) const;

  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
  std::optional<Appearance> built_;
};

}  // namespace tilt_core

#endif  // TILT_CORE_INTERACTION_ROTATION_ARBITER_HPP
