// Ticket: 0002_easing_curves

#ifndef TILT_CORE_EASING_HPP
#define TILT_CORE_EASING_HPP

#include <array>
#include <cstdint>

namespace tilt_core
{

/// Cubic ease-out, 1 - (1 - t)^3. t is clamped to [0, 1].
double easeOutCubic(double t);

/**
 * @brief Timing curve attached to an animation hint
 *
 * Maps normalized time t in [0, 1] to animation progress. Every curve starts
 * at exactly 0 and ends at exactly 1; overshooting curves (the flip bezier,
 * the spring) may leave [0, 1] in between.
 *
 * Cubic bezier curves follow the CSS/CoreAnimation convention: implicit end
 * points (0, 0) and (1, 1), control points (x1, y1) and (x2, y2), with x
 * solved for t by Newton iteration.
 *
 * Thread safety: Value type (safe to copy)
 */
class Easing
{
public:
  enum class Kind : uint8_t
  {
    Linear,
    EaseOut,
    EaseInOut,
    CubicBezier,
    Spring
  };

  static Easing linear();
  static Easing easeOut();
  static Easing easeInOut();

  /**
   * @brief Arbitrary cubic bezier timing curve
   * @throws std::invalid_argument if x1 or x2 lies outside [0, 1] or any
   *         control point is not finite
   */
  static Easing cubicBezier(double x1, double y1, double x2, double y2);

  /// The overshoot curve used for the flip settle: (0.34, 1.35, 0.64, 1.0)
  static Easing overshoot();

  /**
   * @brief Damped unit-mass spring mapped onto the animation duration
   * @param stiffness Spring constant [1/s^2 in normalized time]
   * @param damping Damping coefficient
   * @throws std::invalid_argument if either parameter is not positive
   */
  static Easing spring(double stiffness = kDefaultSpringStiffness,
                       double damping = kDefaultSpringDamping);

  [[nodiscard]] Kind kind() const
  {
    return kind_;
  }

  [[nodiscard]] const std::array<double, 4>& parameters() const
  {
    return params_;
  }

  /// Progress at normalized time t (clamped to [0, 1])
  [[nodiscard]] double operator()(double t) const;

  bool operator==(const Easing&) const = default;

  static constexpr double kDefaultSpringStiffness = 120.0;
  static constexpr double kDefaultSpringDamping = 14.0;

private:
  Easing(Kind kind, std::array<double, 4> params);

  Kind kind_;
  std::array<double, 4> params_;
};

}  // namespace tilt_core

#endif  // TILT_CORE_EASING_HPP
