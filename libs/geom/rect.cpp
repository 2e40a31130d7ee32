#include <libs/geom/rect.hpp>

namespace geom {

std::optional<rect> rect::intersection(const rect& other) const noexcept {
  const fixed::fp x_start = fixed::max(left(), other.left());
  const fixed::fp x_end = fixed::min(right(), other.right());
  const fixed::fp y_start = fixed::max(bottom(), other.bottom());
  const fixed::fp y_end = fixed::min(top(), other.top());

  if (x_end <= x_start || y_end <= y_start)
    return std::nullopt;
  return rect{{x_start, y_start}, {x_end - x_start, y_end - y_start}};
}

rect rect::united(const rect& other) const noexcept {
  const vector min{fixed::min(left(), other.left()), fixed::min(bottom(), other.bottom())};
  const vector max{fixed::max(right(), other.right()), fixed::max(top(), other.top())};
  return {min, max - min};
}

rect rect::expanded(vector offset) const noexcept { return {pos - offset, size + offset * 2}; }

rect rect::contracted(vector offset) const noexcept { return {pos + offset, size - offset * 2}; }

} // namespace geom
