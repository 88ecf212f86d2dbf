#ifndef ICOLLIDER_HPP
#define ICOLLIDER_HPP

#include "ecs/ecs.hpp"
#include <glm/glm.hpp>

// What kind of body an entity is. Snapshots report it to the presentation
// layer; overlap tests never filter on it.
enum class CollisionLayer : uint32_t {
    DEFAULT = 0,
    PLAYER,
    ASTEROID,
    ENEMY,
    BOSS,
    BULLET,
    MISSILE,
    BOSS_PROJECTILE,
    PICKUP,
    SHIELD
};

struct CollisionInfo {
    Entity otherEntity = NULL_ENTITY;
    glm::vec2 normal = glm::vec2(0.0f);        // from self towards other
    float penetration = 0.0f;
    glm::vec2 contactPoint = glm::vec2(0.0f);
};

// Base for every collider shape
class ICollider : public IComponent {
public:
    virtual ~ICollider() = default;

    CollisionLayer layer = CollisionLayer::DEFAULT;
};

#endif // ICOLLIDER_HPP
