#ifndef ECS_COMMON_H
#define ECS_COMMON_H

#include "ecs.hpp"
#include <glm/glm.hpp>
#include <cmath>

// 2D placement of an entity: position in world pixels and heading in radians
class Transform : public IComponent {
public:
    Transform()
        : position(0.0f, 0.0f)
        , rotation(0.0f)
    {}

    Transform(const glm::vec2& pos, float heading = 0.0f)
        : position(pos)
        , rotation(heading)
    {}

    void setPosition(const glm::vec2& pos) {
        position = pos;
    }

    void translate(const glm::vec2& delta) {
        position += delta;
    }

    const glm::vec2& getPosition() const { return position; }

    void setRotation(float heading) {
        rotation = heading;
    }

    void rotate(float delta) {
        rotation += delta;
    }

    float getRotation() const { return rotation; }

private:
    glm::vec2 position;
    float rotation;
};

// How an entity treats the world boundary after moving
enum class WrapMode {
    Wrap,   // reappear on the opposite edge
    Clamp,  // stay inside the world
    Cull,   // destroyed once fully outside
    None
};

class Kinematics : public IComponent {
public:
    glm::vec2 velocity;
    WrapMode wrapMode;

    Kinematics(const glm::vec2& vel = glm::vec2(0.0f), WrapMode mode = WrapMode::Wrap)
        : velocity(vel), wrapMode(mode) {}
};

#endif // ECS_COMMON_H
