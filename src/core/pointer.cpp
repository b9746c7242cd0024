#include <layerfx/pointer.hpp>

namespace layerfx {

std::optional<Vec2> normalizePointer(float x, float y, Size surface) {
    if (surface.empty()) return std::nullopt;

    const float w = static_cast<float>(surface.width);
    const float h = static_cast<float>(surface.height);
    return Vec2{x / w, 1.0f - y / h};
}

} // namespace layerfx
