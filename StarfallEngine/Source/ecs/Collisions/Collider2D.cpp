#include "CircleCollider2D.hpp"
#include "CollisionHelpers.hpp"
#include <glm/glm.hpp>
#include <cmath>

// ==================== Circle vs circle ====================

bool CircleCollider2D::CollidesWith(const glm::vec2& center, const CircleCollider2D& other,
                                    const glm::vec2& otherCenter, CollisionInfo& info) const {
    glm::vec2 delta = otherCenter - center;
    float distanceSquared = glm::dot(delta, delta);
    float radiusSum = radius + other.radius;
    float radiusSumSquared = radiusSum * radiusSum;

    if (distanceSquared >= radiusSumSquared) {
        return false;
    }

    float distance = std::sqrt(distanceSquared);

    if (distance > 0.0001f) {
        info.normal = delta / distance;
        info.penetration = radiusSum - distance;
        info.contactPoint = center + delta * (radius / distance);
    } else {
        // Concentric: any normal will do
        info.normal = glm::vec2(1.0f, 0.0f);
        info.penetration = radiusSum;
        info.contactPoint = center;
    }

    return true;
}

// ==================== Entity overlap ====================

bool CheckOverlap(const EntityManager& entityManager, Entity a, Entity b, CollisionInfo& info) {
    if (a == b || !entityManager.IsActive(a) || !entityManager.IsActive(b)) {
        return false;
    }

    const Transform* transformA = entityManager.GetComponent<Transform>(a);
    const Transform* transformB = entityManager.GetComponent<Transform>(b);
    const CircleCollider2D* colliderA = entityManager.GetComponent<CircleCollider2D>(a);
    const CircleCollider2D* colliderB = entityManager.GetComponent<CircleCollider2D>(b);

    if (!transformA || !transformB || !colliderA || !colliderB) {
        return false;
    }

    // Broad phase before the exact test
    if (!CollisionHelpers::AABBOverlap2D(colliderA->GetMin(transformA->getPosition()),
                                         colliderA->GetMax(transformA->getPosition()),
                                         colliderB->GetMin(transformB->getPosition()),
                                         colliderB->GetMax(transformB->getPosition()))) {
        return false;
    }

    if (!colliderA->CollidesWith(transformA->getPosition(), *colliderB, transformB->getPosition(), info)) {
        return false;
    }

    info.otherEntity = b;
    return true;
}

bool CheckOverlap(const EntityManager& entityManager, Entity a, Entity b) {
    CollisionInfo info;
    return CheckOverlap(entityManager, a, b, info);
}
