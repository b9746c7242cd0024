#pragma once

#include <layerfx/uniforms.hpp>
#include <layerfx/window.hpp>

#include <optional>

namespace layerfx {

// Window coordinates (origin top-left) -> uMousePos space (origin
// bottom-left, 0..1 across the surface): (x / W, 1 - y / H). Positions
// outside the surface map outside 0..1. nullopt when the surface is empty.
[[nodiscard]] std::optional<Vec2> normalizePointer(float x, float y, Size surface);

} // namespace layerfx
