#include <libs/fixed/fp.hpp>

namespace fixed {

namespace {

constexpr std::int64_t one = fp::one_raw;

constexpr std::int64_t mul(std::int64_t lhs, std::int64_t rhs) noexcept {
  return (lhs * rhs) >> fp::frac_bits;
}

// Both polynomials expect x in [-pi/2, pi/2]
// sin x = x(1 - x^2/6(1 - x^2/20(1 - x^2/42(1 - x^2/72))))
constexpr std::int64_t sin_poly(std::int64_t x) noexcept {
  const std::int64_t x2 = mul(x, x);
  std::int64_t t = one - x2 / 72;
  t = one - mul(x2, t) / 42;
  t = one - mul(x2, t) / 20;
  t = one - mul(x2, t) / 6;
  return mul(x, t);
}

// cos x = 1 - x^2/2(1 - x^2/12(1 - x^2/30(1 - x^2/56(1 - x^2/90))))
constexpr std::int64_t cos_poly(std::int64_t x) noexcept {
  const std::int64_t x2 = mul(x, x);
  std::int64_t t = one - x2 / 90;
  t = one - mul(x2, t) / 56;
  t = one - mul(x2, t) / 30;
  t = one - mul(x2, t) / 12;
  return one - mul(x2, t) / 2;
}

static_assert(sin_poly(0) == 0);
static_assert(cos_poly(0) == one);

/// Reduces angle to [-pi, pi]
constexpr std::int64_t reduce(fp angle) noexcept {
  std::int64_t r = std::int64_t{angle.raw()} % tau.raw();
  if (r > pi.raw())
    r -= tau.raw();
  else if (r < -pi.raw())
    r += tau.raw();
  return r;
}

} // namespace

fp fp::sqrt() const {
  if (raw_ < 0)
    throw std::domain_error{"square root of negative fixed point value"};
  return from_raw(static_cast<std::int32_t>(isqrt(static_cast<std::uint64_t>(raw_) << frac_bits)));
}

fp hypot(fp x, fp y) noexcept {
  const std::int64_t wx = x.raw();
  const std::int64_t wy = y.raw();
  // each square is at most 2^62, the sum fits into uint64
  const std::uint64_t len = isqrt(static_cast<std::uint64_t>(wx * wx) + static_cast<std::uint64_t>(wy * wy));
  if (len > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max()))
    return fp::from_raw(std::numeric_limits<std::int32_t>::max());
  return fp::from_raw(static_cast<std::int32_t>(len));
}

fp fp::sin() const noexcept {
  std::int64_t r = reduce(*this);
  if (r > frac_pi_2.raw())
    r = pi.raw() - r;
  else if (r < -frac_pi_2.raw())
    r = -pi.raw() - r;
  return from_raw(static_cast<std::int32_t>(sin_poly(r)));
}

fp fp::cos() const noexcept {
  std::int64_t r = reduce(*this);
  if (r < 0)
    r = -r;
  if (r > frac_pi_2.raw())
    return from_raw(static_cast<std::int32_t>(-cos_poly(pi.raw() - r)));
  return from_raw(static_cast<std::int32_t>(cos_poly(r)));
}

} // namespace fixed
