#pragma once

#include <optional>
#include <type_traits>

#include <libs/fixed/fp.hpp>
#include <libs/geom/vector.hpp>

namespace geom {

/**
 * Axis aligned rectangle defined by its minimal corner and size.
 *
 * Size components are expected to be non negative. It is not enforced: negative size is
 * representable but right/top, containment and overlap checks give meaningless results for it.
 *
 *   (left, top) +---------+ (right, top)
 *               |         |
 *           pos +---------+ (right, bottom)
 */
struct rect {
  vector pos;
  vector size;

  template <typename T>
    requires std::is_arithmetic_v<T>
  static constexpr rect from(T x, T y, T width, T height) noexcept {
    return {vector::from(x, y), vector::from(width, height)};
  }

  constexpr fixed::fp left() const noexcept { return pos.x; }
  constexpr fixed::fp bottom() const noexcept { return pos.y; }
  constexpr fixed::fp right() const noexcept { return pos.x + size.x; }
  constexpr fixed::fp top() const noexcept { return pos.y + size.y; }

  constexpr rect move_by(vector offset) const noexcept { return {pos + offset, size}; }

  constexpr fixed::fp area() const noexcept { return size.x * size.y; }
  constexpr fixed::fp perimeter() const noexcept { return fixed::fp{2} * (size.x + size.y); }
  /// Throws std::domain_error for zero height.
  constexpr fixed::fp aspect_ratio() const { return size.x / size.y; }

  /// Half open on both axes: [left, right) x [bottom, top)
  constexpr bool contains_point(vector pt) const noexcept {
    return pt.x >= left() && pt.x < right() && pt.y >= bottom() && pt.y < top();
  }

  // The far corner goes through the same half open test, so a rect is not contained in itself.
  constexpr bool contains_rect(const rect& other) const noexcept {
    return contains_point(other.pos) && contains_point(other.pos + other.size);
  }

  /// Touching edges count as overlapping, see intersection for the strict variant.
  constexpr bool is_overlapping(const rect& other) const noexcept {
    return !(
        right() < other.left() || left() > other.right() || bottom() > other.top() ||
        top() < other.bottom()
    );
  }

  /// Common region of non zero width and height or nullopt.
  [[nodiscard]] std::optional<rect> intersection(const rect& other) const noexcept;
  /// Smallest rect containing both.
  rect united(const rect& other) const noexcept;

  rect expanded(vector offset) const noexcept;
  // No check for contraction by more than half of the size.
  rect contracted(vector offset) const noexcept;

  constexpr bool operator==(const rect&) const noexcept = default;
};

} // namespace geom
