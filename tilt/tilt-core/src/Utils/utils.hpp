#ifndef TILT_CORE_UTILS_HPP
#define TILT_CORE_UTILS_HPP

#include <algorithm>
#include <cmath>
#include <concepts>

namespace tilt_core
{

// Helper function for comparing doubles with tolerance
constexpr double TOLERANCE = 1e-10;

template <std::floating_point T>
bool almostEqual(T a, T b, double tolerance = TOLERANCE)
{
  return std::abs(a - b) < tolerance;
}

/// Clamp to the symmetric band [-limit, +limit]
template <std::floating_point T>
T clampSymmetric(T value, T limit)
{
  return std::clamp(value, -limit, limit);
}

}  // namespace tilt_core

#endif  // TILT_CORE_UTILS_HPP
