#ifndef VECTOR2_HPP
#define VECTOR2_HPP

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <cmath>

// Value-returning 2D vector helpers over glm::vec2
namespace Vec2 {

inline float Magnitude(const glm::vec2& v) {
    return std::sqrt(v.x * v.x + v.y * v.y);
}

// Zero vector stays zero
inline glm::vec2 Normalize(const glm::vec2& v) {
    float mag = Magnitude(v);
    if (mag == 0.0f) {
        return glm::vec2(0.0f);
    }
    return v / mag;
}

inline float Distance(const glm::vec2& a, const glm::vec2& b) {
    return Magnitude(b - a);
}

inline float DistanceSquared(const glm::vec2& a, const glm::vec2& b) {
    glm::vec2 d = b - a;
    return d.x * d.x + d.y * d.y;
}

inline glm::vec2 FromAngle(float angle, float magnitude = 1.0f) {
    return glm::vec2(std::cos(angle) * magnitude, std::sin(angle) * magnitude);
}

inline float Angle(const glm::vec2& v) {
    return std::atan2(v.y, v.x);
}

inline glm::vec2 Limit(const glm::vec2& v, float maxMagnitude) {
    float mag = Magnitude(v);
    if (mag > maxMagnitude && mag > 0.0f) {
        return v * (maxMagnitude / mag);
    }
    return v;
}

// Wraps an angle difference into (-pi, pi]
inline float WrapAngle(float angle) {
    const float twoPi = glm::two_pi<float>();
    while (angle > glm::pi<float>()) angle -= twoPi;
    while (angle <= -glm::pi<float>()) angle += twoPi;
    return angle;
}

} // namespace Vec2

#endif // VECTOR2_HPP
