#pragma once

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include <libs/geom/rect.hpp>
#include <libs/geom/vector.hpp>

// Float copies for rendering. Nothing converted to glm is expected to come back into simulation.
namespace geom {

inline glm::vec2 to_glm(vector v) noexcept { return {v.x.to_float(), v.y.to_float()}; }

/// x, y, width, height
inline glm::vec4 to_glm(const rect& r) noexcept {
  return {r.pos.x.to_float(), r.pos.y.to_float(), r.size.x.to_float(), r.size.y.to_float()};
}

inline vector from_glm(glm::vec2 v) noexcept { return vector::from(v.x, v.y); }

} // namespace geom
