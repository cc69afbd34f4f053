#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/epsilon.hpp>

namespace frameline::core {

// Vector types
using Vec2 = glm::vec2;
using Vec4 = glm::vec4;

// Integer vector types
using IVec2 = glm::ivec2;

// Axis-aligned rectangle in 2D (origin at top-left)
struct Rect {
    Vec2 position{0.0f};
    Vec2 size{0.0f};

    Rect() = default;
    Rect(const Vec2& position_, const Vec2& size_) : position(position_), size(size_) {}

    Vec2 min() const { return position; }
    Vec2 max() const { return position + size; }

    bool contains(const Vec2& point) const {
        return point.x >= position.x && point.x < position.x + size.x &&
               point.y >= position.y && point.y < position.y + size.y;
    }

    bool empty() const { return size.x <= 0.0f || size.y <= 0.0f; }
};

inline bool exactly_equal(const Vec2& a, const Vec2& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool nearly_equal(const Vec4& a, const Vec4& b, float epsilon = 1e-4f) {
    return glm::all(glm::epsilonEqual(a, b, epsilon));
}

} // namespace frameline::core
