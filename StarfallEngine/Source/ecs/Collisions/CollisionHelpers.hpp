#ifndef COLLISION_HELPERS_HPP
#define COLLISION_HELPERS_HPP

#include <glm/glm.hpp>

namespace CollisionHelpers {

// Touching boxes count as overlapping; the exact circle test decides afterwards
inline bool AABBOverlap2D(const glm::vec2& min1, const glm::vec2& max1,
                          const glm::vec2& min2, const glm::vec2& max2) {
    return min1.x <= max2.x && max1.x >= min2.x &&
           min1.y <= max2.y && max1.y >= min2.y;
}

template<typename T>
inline T Clamp(T value, T min, T max) {
    return value < min ? min : (value > max ? max : value);
}

// ==================== World Bounds ====================
// Positions are circle centers; radius widens the band around the world.

// Wraps each axis independently into [-radius, bound + radius]
inline glm::vec2 WrapPosition(const glm::vec2& position, float radius, float width, float height) {
    glm::vec2 result = position;
    if (result.x < -radius) result.x = width + radius;
    else if (result.x > width + radius) result.x = -radius;
    if (result.y < -radius) result.y = height + radius;
    else if (result.y > height + radius) result.y = -radius;
    return result;
}

// Keeps the whole circle inside the world
inline glm::vec2 ClampPosition(const glm::vec2& position, float radius, float width, float height) {
    return glm::vec2(Clamp(position.x, radius, width - radius),
                     Clamp(position.y, radius, height - radius));
}

// True once the circle is completely outside the world
inline bool IsOutsideBounds(const glm::vec2& position, float radius, float width, float height) {
    return position.x < -radius || position.x > width + radius ||
           position.y < -radius || position.y > height + radius;
}

} // namespace CollisionHelpers

#endif // COLLISION_HELPERS_HPP
