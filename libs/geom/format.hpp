#pragma once

#include <fmt/format.h>

#include <libs/fixed/fp_format.hpp>
#include <libs/geom/rect.hpp>
#include <libs/geom/vector.hpp>

template <>
struct fmt::formatter<geom::vector> {
  constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    if (it != ctx.end() && *it != '}')
      throw fmt::format_error{"invalid format for geom::vector"};
    return it;
  }

  template <typename FormatContext>
  auto format(geom::vector v, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "vec:{},{}", v.x, v.y);
  }
};

/**
 * {}  -> (x, y, width, height)
 * {:d} -> rect:(x,y,width,height)
 */
template <>
struct fmt::formatter<geom::rect> {
  bool debug = false;

  constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    if (it != ctx.end() && *it == 'd') {
      debug = true;
      ++it;
    }
    if (it != ctx.end() && *it != '}')
      throw fmt::format_error{"invalid format for geom::rect"};
    return it;
  }

  template <typename FormatContext>
  auto format(const geom::rect& r, FormatContext& ctx) const -> decltype(ctx.out()) {
    if (debug)
      return fmt::format_to(
          ctx.out(), "rect:({},{},{},{})", r.pos.x, r.pos.y, r.size.x, r.size.y
      );
    return fmt::format_to(ctx.out(), "({}, {}, {}, {})", r.pos.x, r.pos.y, r.size.x, r.size.y);
  }
};
