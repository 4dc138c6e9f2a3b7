// Ticket: 0002_angular_velocity

#ifndef TILT_CORE_ANGULAR_VELOCITY_HPP
#define TILT_CORE_ANGULAR_VELOCITY_HPP

#include <cmath>
#include <tuple>

#include <Eigen/Dense>

#include "tilt-core/src/DataTypes/Vec2FormatterBase.hpp"

namespace tilt_core
{

/**
 * @brief Per-tick angular velocity of the card [rad/tick]
 *
 * Inherits from Eigen::Vector2d for full matrix operation support.
 * Provides semantic yaw/pitch accessors without any normalization; a fast
 * flick can exceed 2pi per tick and must not be wrapped.
 *
 * Axis convention:
 * - yaw:   Rotation around the card's vertical axis (component 0)
 * - pitch: Tilt around the card's horizontal axis (component 1)
 */
class AngularVelocity final : public Eigen::Vector2d
{
public:
  // Default constructor - initializes to (0, 0)
  AngularVelocity() : Eigen::Vector2d{0.0, 0.0}
  {
  }

  AngularVelocity(double yawRate, double pitchRate)
    : Eigen::Vector2d{yawRate, pitchRate}
  {
  }

  // Template constructor for Eigen expressions
  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  AngularVelocity(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector2d{other}
  {
  }

  // Template assignment for Eigen expressions
  template <typename OtherDerived>
  AngularVelocity& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector2d::operator=(other);
    return *this;
  }

  double& yaw()
  {
    return (*this)[0];
  }

  double& pitch()
  {
    return (*this)[1];
  }

  [[nodiscard]] double yaw() const
  {
    return (*this)[0];
  }

  [[nodiscard]] double pitch() const
  {
    return (*this)[1];
  }

  /// True when both components are finite
  [[nodiscard]] bool isFinite() const
  {
    return std::isfinite(yaw()) && std::isfinite(pitch());
  }

  /// True when both components are strictly below the threshold in magnitude
  [[nodiscard]] bool isBelow(double threshold) const
  {
    return std::abs(yaw()) < threshold && std::abs(pitch()) < threshold;
  }

  // Rule of Zero
  AngularVelocity(const AngularVelocity&) = default;
  AngularVelocity(AngularVelocity&&) noexcept = default;
  AngularVelocity& operator=(const AngularVelocity&) = default;
  AngularVelocity& operator=(AngularVelocity&&) noexcept = default;
  ~AngularVelocity() = default;
};

}  // namespace tilt_core

// Formatter specialization for fmt / spdlog
template <>
struct fmt::formatter<tilt_core::AngularVelocity>
  : tilt_core::detail::Vec2FormatterBase<tilt_core::AngularVelocity>
{
  auto format(const tilt_core::AngularVelocity& rate,
              fmt::format_context& ctx) const
  {
    return formatComponents(
      rate,
      [](const auto& r) { return std::tuple{r.yaw(), r.pitch()}; },
      ctx);
  }
};

#endif  // TILT_CORE_ANGULAR_VELOCITY_HPP
