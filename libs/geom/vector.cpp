#include <libs/geom/vector.hpp>

namespace geom {

fixed::fp vector::len() const noexcept { return fixed::hypot(x, y); }

std::optional<vector> vector::normalize() const noexcept {
  const std::int64_t wx = x.raw();
  const std::int64_t wy = y.raw();
  const auto length = static_cast<std::int64_t>(
      fixed::isqrt(static_cast<std::uint64_t>(wx * wx) + static_cast<std::uint64_t>(wy * wy))
  );
  if (length == 0)
    return std::nullopt;
  // |component| <= length so every quotient is within [-1, 1]
  const auto unit = [length](std::int64_t c) {
    return fixed::fp::from_raw(static_cast<std::int32_t>(c * fixed::fp::one_raw / length));
  };
  return vector{unit(wx), unit(wy)};
}

vector vector::rotate(fixed::fp angle) const noexcept {
  const fixed::fp cos = angle.cos();
  const fixed::fp sin = angle.sin();
  return {x * cos - y * sin, x * sin + y * cos};
}

} // namespace geom
