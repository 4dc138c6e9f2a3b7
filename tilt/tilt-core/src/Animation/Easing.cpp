// Ticket: 0002_easing_curves

#include "tilt-core/src/Animation/Easing.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tilt_core
{

namespace
{

constexpr int kNewtonIterations = 5;

double bezierComponent(double s, double p1, double p2)
{
  const double ms = 1.0 - s;
  return 3.0 * ms * ms * s * p1 + 3.0 * ms * s * s * p2 + s * s * s;
}

double bezierSlope(double s, double p1, double p2)
{
  const double ms = 1.0 - s;
  return 3.0 * ms * ms * p1 + 6.0 * ms * s * (p2 - p1) + 3.0 * s * s * (1.0 - p2);
}

double solveBezier(double x, const std::array<double, 4>& p)
{
  // Newton iteration on x(s) = x, starting from s = x
  double s = x;
  for (int i = 0; i < kNewtonIterations; ++i)
  {
    const double dx = bezierSlope(s, p[0], p[2]);
    if (dx != 0.0)
    {
      s -= (bezierComponent(s, p[0], p[2]) - x) / dx;
    }
    s = std::clamp(s, 0.0, 1.0);
  }
  return bezierComponent(s, p[1], p[3]);
}

double springUnit(double t, double stiffness, double damping)
{
  // Unit mass, zero initial velocity
  const double wn = std::sqrt(stiffness);
  const double zeta = damping / (2.0 * wn);

  if (zeta < 1.0)
  {
    const double wd = wn * std::sqrt(1.0 - zeta * zeta);
    const double b = zeta * wn / wd;
    const double e = std::exp(-zeta * wn * t);
    return 1.0 - e * (std::cos(wd * t) + b * std::sin(wd * t));
  }
  if (zeta == 1.0)
  {
    return 1.0 - std::exp(-wn * t) * (1.0 + wn * t);
  }
  const double wd = wn * std::sqrt(zeta * zeta - 1.0);
  const double e1 = std::exp(-(zeta * wn - wd) * t);
  const double e2 = std::exp(-(zeta * wn + wd) * t);
  return 1.0 - 0.5 * (e1 + e2);
}

}  // namespace

double easeOutCubic(double t)
{
  const double u = 1.0 - std::clamp(t, 0.0, 1.0);
  return 1.0 - u * u * u;
}

Easing::Easing(Kind kind, std::array<double, 4> params)
  : kind_{kind}, params_{params}
{
}

Easing Easing::linear()
{
  return Easing{Kind::Linear, {0.0, 0.0, 1.0, 1.0}};
}

Easing Easing::easeOut()
{
  return Easing{Kind::EaseOut, {0.0, 0.0, 0.0, 0.0}};
}

Easing Easing::easeInOut()
{
  return Easing{Kind::EaseInOut, {0.42, 0.0, 0.58, 1.0}};
}

Easing Easing::cubicBezier(double x1, double y1, double x2, double y2)
{
  if (!std::isfinite(x1) || !std::isfinite(y1) || !std::isfinite(x2) ||
      !std::isfinite(y2))
  {
    throw std::invalid_argument(
      "Easing::cubicBezier: control points must be finite");
  }
  if (x1 < 0.0 || x1 > 1.0 || x2 < 0.0 || x2 > 1.0)
  {
    throw std::invalid_argument(
      "Easing::cubicBezier: x control points must lie in [0, 1]");
  }
  return Easing{Kind::CubicBezier, {x1, y1, x2, y2}};
}

Easing Easing::overshoot()
{
  return cubicBezier(0.34, 1.35, 0.64, 1.0);
}

Easing Easing::spring(double stiffness, double damping)
{
  if (!(stiffness > 0.0) || !(damping > 0.0) || !std::isfinite(stiffness) ||
      !std::isfinite(damping))
  {
    throw std::invalid_argument(
      "Easing::spring: stiffness and damping must be positive");
  }
  return Easing{Kind::Spring, {stiffness, damping, 0.0, 0.0}};
}

double Easing::operator()(double t) const
{
  if (!(t > 0.0))
  {
    return 0.0;
  }
  if (t >= 1.0)
  {
    return 1.0;
  }

  switch (kind_)
  {
    case Kind::Linear:
      return t;
    case Kind::EaseOut:
      return easeOutCubic(t);
    case Kind::EaseInOut:
    case Kind::CubicBezier:
      return solveBezier(t, params_);
    case Kind::Spring:
      return springUnit(t, params_[0], params_[1]);
  }
  return t;
}

}  // namespace tilt_core
