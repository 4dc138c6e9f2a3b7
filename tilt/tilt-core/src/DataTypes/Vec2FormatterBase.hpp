// Ticket: 0002_angular_velocity

#ifndef TILT_CORE_VEC2_FORMATTER_BASE_HPP
#define TILT_CORE_VEC2_FORMATTER_BASE_HPP

#include <fmt/format.h>

namespace tilt_core::detail
{

/// Shared formatter base for 2-component vector types.
/// Accepts an optional fixed-point precision ("{:.3}" or "{:.3f}") and
/// emits "(c0, c1)".
template <typename T>
struct Vec2FormatterBase
{
  int precision = 6;

  constexpr auto parse(fmt::format_parse_context& ctx)
  {
    auto it = ctx.begin();
    const auto end = ctx.end();

    if (it != end && *it == '.')
    {
      ++it;
      precision = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        precision = precision * 10 + (*it - '0');
        ++it;
      }
    }
    if (it != end && *it == 'f')
    {
      ++it;
    }
    if (it != end && *it != '}')
    {
      throw fmt::format_error("invalid format for a 2-component vector");
    }
    return it;
  }

protected:
  template <typename F>
  auto formatComponents(const T& vec,
                        F&& accessor,
                        fmt::format_context& ctx) const
  {
    auto [c0, c1] = accessor(vec);
    return fmt::format_to(
      ctx.out(), "({:.{}f}, {:.{}f})", c0, precision, c1, precision);
  }
};

}  // namespace tilt_core::detail

#endif  // TILT_CORE_VEC2_FORMATTER_BASE_HPP
