#pragma once

#include <compare>
#include <concepts>
#include <cstdint>
#include <limits>
#include <stdexcept>

/**
 * Q16.16 fixed point number.
 *
 * Value is stored as 32 bit two's complement integer with 16 fractional bits. All arithmetic is
 * done on integers only so results are bit identical on every platform and compiler. Addition,
 * subtraction and negation wrap around on overflow instead of invoking undefined behaviour.
 */
namespace fixed {

class fp {
public:
  static constexpr int frac_bits = 16;
  static constexpr std::int32_t one_raw = std::int32_t{1} << frac_bits;

  constexpr fp() noexcept = default;

  template <std::integral I>
  explicit constexpr fp(I whole) noexcept
      : raw_{static_cast<std::int32_t>(static_cast<std::uint32_t>(whole) << frac_bits)} {}

  // Truncates toward zero and saturates at the range limits, NaN gives zero. Intended for
  // literals and asset data, never for simulation values.
  template <std::floating_point F>
  explicit constexpr fp(F val) noexcept : raw_{saturate(val * static_cast<F>(one_raw))} {}

  static constexpr fp from_raw(std::int32_t raw) noexcept {
    fp res;
    res.raw_ = raw;
    return res;
  }

  [[nodiscard]] constexpr std::int32_t raw() const noexcept { return raw_; }

  static constexpr fp zero() noexcept { return {}; }
  static constexpr fp one() noexcept { return from_raw(one_raw); }
  static constexpr fp neg_one() noexcept { return from_raw(-one_raw); }

  [[nodiscard]] constexpr bool is_zero() const noexcept { return raw_ == 0; }

  [[nodiscard]] constexpr fp abs() const noexcept {
    return raw_ < 0 ? from_raw(static_cast<std::int32_t>(0u - static_cast<std::uint32_t>(raw_)))
                    : *this;
  }

  /// Floor of the square root. Throws std::domain_error for negative values.
  [[nodiscard]] fp sqrt() const;
  /// Angle is in radians. Absolute error is below 2e-4 on the whole range.
  [[nodiscard]] fp sin() const noexcept;
  [[nodiscard]] fp cos() const noexcept;

  [[nodiscard]] constexpr double to_double() const noexcept {
    return static_cast<double>(raw_) / one_raw;
  }
  [[nodiscard]] constexpr float to_float() const noexcept {
    return static_cast<float>(to_double());
  }

  constexpr auto operator<=>(const fp&) const noexcept = default;
  constexpr bool operator==(const fp&) const noexcept = default;

private:
  template <std::floating_point F>
  static constexpr std::int32_t saturate(F scaled) noexcept {
    using limits = std::numeric_limits<std::int32_t>;
    if (scaled != scaled)
      return 0;
    if (scaled >= static_cast<F>(limits::max()))
      return limits::max();
    if (scaled <= static_cast<F>(limits::min()))
      return limits::min();
    return static_cast<std::int32_t>(scaled);
  }

private:
  std::int32_t raw_ = 0;
};

static_assert(sizeof(fp) == 4);

inline constexpr fp pi = fp::from_raw(205887);
inline constexpr fp frac_pi_2 = fp::from_raw(102944);
inline constexpr fp tau = fp::from_raw(411775);

constexpr fp operator+(fp lhs, fp rhs) noexcept {
  return fp::from_raw(static_cast<std::int32_t>(
      static_cast<std::uint32_t>(lhs.raw()) + static_cast<std::uint32_t>(rhs.raw())
  ));
}

constexpr fp operator-(fp lhs, fp rhs) noexcept {
  return fp::from_raw(static_cast<std::int32_t>(
      static_cast<std::uint32_t>(lhs.raw()) - static_cast<std::uint32_t>(rhs.raw())
  ));
}

constexpr fp operator-(fp val) noexcept {
  return fp::from_raw(static_cast<std::int32_t>(0u - static_cast<std::uint32_t>(val.raw())));
}

constexpr fp operator*(fp lhs, fp rhs) noexcept {
  const std::int64_t wide = std::int64_t{lhs.raw()} * rhs.raw();
  return fp::from_raw(static_cast<std::int32_t>(wide >> fp::frac_bits));
}

constexpr fp operator/(fp lhs, fp rhs) {
  if (rhs.is_zero())
    throw std::domain_error{"fixed point division by zero"};
  const std::int64_t wide = std::int64_t{lhs.raw()} * fp::one_raw;
  return fp::from_raw(static_cast<std::int32_t>(wide / rhs.raw()));
}

constexpr fp& operator+=(fp& lhs, fp rhs) noexcept { return lhs = lhs + rhs; }
constexpr fp& operator-=(fp& lhs, fp rhs) noexcept { return lhs = lhs - rhs; }
constexpr fp& operator*=(fp& lhs, fp rhs) noexcept { return lhs = lhs * rhs; }
constexpr fp& operator/=(fp& lhs, fp rhs) { return lhs = lhs / rhs; }

/// Floor of the square root of a 64 bit unsigned integer.
constexpr std::uint64_t isqrt(std::uint64_t n) noexcept {
  std::uint64_t res = 0;
  std::uint64_t bit = std::uint64_t{1} << 62;
  while (bit > n)
    bit >>= 2;
  while (bit != 0) {
    if (n >= res + bit) {
      n -= res + bit;
      res = (res >> 1) + bit;
    } else {
      res >>= 1;
    }
    bit >>= 2;
  }
  return res;
}

/// Square root of x*x + y*y summed in 64 bits, so it never wraps. Values above the fp range
/// (both components close to 32768 in magnitude) saturate to the largest fp.
fp hypot(fp x, fp y) noexcept;

constexpr fp min(fp lhs, fp rhs) noexcept { return rhs < lhs ? rhs : lhs; }
constexpr fp max(fp lhs, fp rhs) noexcept { return lhs < rhs ? rhs : lhs; }

} // namespace fixed
