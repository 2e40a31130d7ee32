#pragma once

#include <cstdint>
#include <optional>
#include <type_traits>

#include <libs/fixed/fp.hpp>

namespace geom {

/**
 * 2D coordinate or direction.
 *
 * All operations are pure and return new values. Components follow fixed::fp range and rules:
 * values lie in [-32768, 32768) with 1/65536 resolution, sums and products wrap around on
 * overflow, so sqr_len() wraps for vectors longer than about 181. len() and normalize() use 64
 * bit intermediates and work on the whole range. Division by zero (component or scalar) is not
 * checked here and propagates std::domain_error from fixed::fp.
 */
struct vector {
  fixed::fp x;
  fixed::fp y;

  template <typename T>
    requires std::is_arithmetic_v<T>
  static constexpr vector from(T x, T y) noexcept {
    return {fixed::fp{x}, fixed::fp{y}};
  }

  static constexpr vector left() noexcept { return {fixed::fp::neg_one(), fixed::fp::zero()}; }
  static constexpr vector right() noexcept { return {fixed::fp::one(), fixed::fp::zero()}; }
  static constexpr vector up() noexcept { return {fixed::fp::zero(), fixed::fp::one()}; }
  static constexpr vector down() noexcept { return {fixed::fp::zero(), fixed::fp::neg_one()}; }

  constexpr fixed::fp sqr_len() const noexcept { return x * x + y * y; }
  /// Saturates at the largest fp for vectors longer than the fp range.
  fixed::fp len() const noexcept;

  /// Unit vector of the same direction or nullopt for zero length vector.
  [[nodiscard]] std::optional<vector> normalize() const noexcept;

  constexpr fixed::fp dot(vector other) const noexcept { return x * other.x + y * other.y; }

  /// Positive when other is counter-clockwise from this.
  constexpr fixed::fp cross(vector other) const noexcept { return x * other.y - y * other.x; }

  constexpr vector scale(vector factor) const noexcept { return {x * factor.x, y * factor.y}; }

  vector rotate(fixed::fp angle) const noexcept;

  constexpr vector abs() const noexcept { return {x.abs(), y.abs()}; }

  constexpr bool operator==(const vector&) const noexcept = default;
};

constexpr vector operator+(vector lhs, vector rhs) noexcept { return {lhs.x + rhs.x, lhs.y + rhs.y}; }
constexpr vector operator-(vector lhs, vector rhs) noexcept { return {lhs.x - rhs.x, lhs.y - rhs.y}; }
constexpr vector operator-(vector v) noexcept { return {-v.x, -v.y}; }

constexpr vector& operator+=(vector& lhs, vector rhs) noexcept { return lhs = lhs + rhs; }
constexpr vector& operator-=(vector& lhs, vector rhs) noexcept { return lhs = lhs - rhs; }

// component-wise
constexpr vector operator*(vector lhs, vector rhs) noexcept { return lhs.scale(rhs); }
constexpr vector operator/(vector lhs, vector rhs) { return {lhs.x / rhs.x, lhs.y / rhs.y}; }

constexpr vector operator*(fixed::fp k, vector v) noexcept { return {k * v.x, k * v.y}; }
constexpr vector operator*(vector v, fixed::fp k) noexcept { return {v.x * k, v.y * k}; }
constexpr vector operator/(vector v, fixed::fp k) { return {v.x / k, v.y / k}; }

constexpr vector operator*(std::int16_t k, vector v) noexcept { return fixed::fp{k} * v; }
constexpr vector operator*(vector v, std::int16_t k) noexcept { return v * fixed::fp{k}; }
constexpr vector operator/(vector v, std::int16_t k) { return v / fixed::fp{k}; }
constexpr vector operator/(std::int16_t k, vector v) {
  return {fixed::fp{k} / v.x, fixed::fp{k} / v.y};
}

} // namespace geom
