#pragma once

#include <fmt/format.h>

#include <libs/fixed/fp.hpp>

// Uses the exact double value so every float presentation ({:.3f}, {:e}, ...) works as well.
template <>
struct fmt::formatter<fixed::fp> : fmt::formatter<double> {
  template <typename FormatContext>
  auto format(fixed::fp val, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<double>::format(val.to_double(), ctx);
  }
};
