#ifndef XPBD_SIM_DATATYPES_VEC3_FORMATTER_BASE_HPP
#define XPBD_SIM_DATATYPES_VEC3_FORMATTER_BASE_HPP

#include <string>

#include <fmt/format.h>

namespace xpbd_sim::detail
{

/// Shared fmt formatter base for 3-component vector types.
/// Provides parse() for [width][.precision][type] format specs
/// and formatComponents() to emit "(c0, c1, c2)" output, so vectors can be
/// passed straight to spdlog.
template <typename T>
struct Vec3FormatterBase
{
  char presentation = 'f';
  int precision = 6;
  int width = 0;

  constexpr auto parse(fmt::format_parse_context& ctx)
  {
    auto it = ctx.begin();
    auto end = ctx.end();

    if (it == end || *it == '}')
    {
      return it;
    }

    // Parse optional width
    if (it != end && *it >= '0' && *it <= '9')
    {
      width = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        width = width * 10 + (*it - '0');
        ++it;
      }
    }

    // Parse optional precision
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

    // Parse optional presentation type
    if (it != end && (*it == 'f' || *it == 'e' || *it == 'g'))
    {
      presentation = *it;
      ++it;
    }

    return it;
  }

  template <typename FormatContext>
  auto format(const T& vec, FormatContext& ctx) const
  {
    std::string const c0 = formatComponent(vec.x());
    std::string const c1 = formatComponent(vec.y());
    std::string const c2 = formatComponent(vec.z());
    return fmt::format_to(ctx.out(), "({}, {}, {})", c0, c1, c2);
  }

private:
  [[nodiscard]] std::string formatComponent(double value) const
  {
    switch (presentation)
    {
      case 'e':
        return fmt::format("{:{}.{}e}", value, width, precision);
      case 'g':
        return fmt::format("{:{}.{}g}", value, width, precision);
      default:
        return fmt::format("{:{}.{}f}", value, width, precision);
    }
  }
};

}  // namespace xpbd_sim::detail

#endif  // XPBD_SIM_DATATYPES_VEC3_FORMATTER_BASE_HPP
