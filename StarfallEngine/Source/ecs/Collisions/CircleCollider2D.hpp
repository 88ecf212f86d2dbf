#ifndef CIRCLECOLLIDER2D_HPP
#define CIRCLECOLLIDER2D_HPP

#include "ICollider.hpp"
#include "ecs/ecs_common.hpp"

// Every body in the arcade is a circle
class CircleCollider2D : public ICollider {
public:
    explicit CircleCollider2D(float radius_ = 1.0f, CollisionLayer layer_ = CollisionLayer::DEFAULT)
        : radius(radius_)
    {
        layer = layer_;
    }

    float radius;

    // Circle vs circle with the centers supplied by the caller.
    // Touching circles (distance == radius sum) do not collide.
    bool CollidesWith(const glm::vec2& center, const CircleCollider2D& other,
                      const glm::vec2& otherCenter, CollisionInfo& info) const;

    glm::vec2 GetMin(const glm::vec2& center) const { return center - glm::vec2(radius); }
    glm::vec2 GetMax(const glm::vec2& center) const { return center + glm::vec2(radius); }
};

// Overlap test between two entities carrying Transform and CircleCollider2D.
// False when either entity is inactive or lacks one of those components.
bool CheckOverlap(const EntityManager& entityManager, Entity a, Entity b);
bool CheckOverlap(const EntityManager& entityManager, Entity a, Entity b, CollisionInfo& info);

#endif // CIRCLECOLLIDER2D_HPP
