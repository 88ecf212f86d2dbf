#include "Spawners.hpp"
#include "Math/Vector2.hpp"
#include <glm/gtc/constants.hpp>

namespace {

constexpr float ASTEROID_SAFE_DISTANCE = 100.0f;
constexpr int ASTEROID_FRAGMENTS = 2;

CircleCollider2D* AddCollider(EntityManager& entityManager, Entity entity, float radius, CollisionLayer layer) {
    return entityManager.AddComponent<CircleCollider2D>(entity, radius, layer);
}

}

void RegisterGameComponents(EntityManager& entityManager) {
    entityManager.RegisterComponentType<Transform>();
    entityManager.RegisterComponentType<Kinematics>();
    entityManager.RegisterComponentType<CircleCollider2D>();
    entityManager.RegisterComponentType<ShipComponent>();
    entityManager.RegisterComponentType<AsteroidComponent>();
    entityManager.RegisterComponentType<BulletComponent>();
    entityManager.RegisterComponentType<EnemyComponent>();
    entityManager.RegisterComponentType<BossComponent>();
    entityManager.RegisterComponentType<BossProjectileComponent>();
    entityManager.RegisterComponentType<HomingMissileComponent>();
    entityManager.RegisterComponentType<PowerUpComponent>();
    entityManager.RegisterComponentType<ShieldComponent>();
}

Entity CreateShip(EntityManager& entityManager, const glm::vec2& position) {
    Entity ship = entityManager.CreateEntity();
    entityManager.AddComponent<Transform>(ship, position, 0.0f);
    entityManager.AddComponent<Kinematics>(ship, glm::vec2(0.0f), WrapMode::Wrap);
    AddCollider(entityManager, ship, ShipComponent::RADIUS, CollisionLayer::PLAYER);
    entityManager.AddComponent<ShipComponent>(ship);
    return ship;
}

std::vector<glm::vec2> GenerateAsteroidOutline(float radius, Random& random) {
    int vertexCount = random.RangeInt(8, 11);
    std::vector<glm::vec2> outline;
    outline.reserve(vertexCount);

    for (int i = 0; i < vertexCount; ++i) {
        float angle = (static_cast<float>(i) / vertexCount) * glm::two_pi<float>();
        outline.push_back(Vec2::FromAngle(angle, radius * random.Range(0.7f, 1.0f)));
    }
    return outline;
}

Entity CreateAsteroid(EntityManager& entityManager, Random& random, AsteroidSize size,
                      const glm::vec2& position, const glm::vec2& velocity) {
    float radius = AsteroidComponent::RadiusFor(size);
    float spin = (random.Next() - 0.5f) * 2.0f;

    Entity asteroid = entityManager.CreateEntity();
    entityManager.AddComponent<Transform>(asteroid, position, 0.0f);
    entityManager.AddComponent<Kinematics>(asteroid, velocity, WrapMode::Wrap);
    AddCollider(entityManager, asteroid, radius, CollisionLayer::ASTEROID);
    entityManager.AddComponent<AsteroidComponent>(asteroid, size, spin, GenerateAsteroidOutline(radius, random));
    return asteroid;
}

Entity CreateRandomAsteroid(EntityManager& entityManager, const GameConfig& config,
                            const DifficultyManager& difficulty, Random& random,
                            const std::optional<glm::vec2>& safeZone) {
    glm::vec2 position(0.0f);
    for (int attempt = 0; attempt < config.spawnAttempts; ++attempt) {
        position = glm::vec2(random.Range(0.0f, config.worldWidth), random.Range(0.0f, config.worldHeight));
        if (!safeZone || Vec2::Distance(position, *safeZone) >= ASTEROID_SAFE_DISTANCE) {
            break;
        }
    }

    float speed = difficulty.GetAsteroidSpeed(random.Range(30.0f, 100.0f));
    glm::vec2 velocity = Vec2::FromAngle(random.Angle(), speed);
    return CreateAsteroid(entityManager, random, AsteroidSize::Large, position, velocity);
}

std::vector<Entity> SplitAsteroid(EntityManager& entityManager, const DifficultyManager& difficulty,
                                  Random& random, Entity asteroid) {
    std::vector<Entity> fragments;

    const AsteroidComponent* rock = entityManager.GetComponent<AsteroidComponent>(asteroid);
    const Transform* transform = entityManager.GetComponent<Transform>(asteroid);
    if (!rock || !transform || rock->size == AsteroidSize::Small) {
        return fragments;
    }

    AsteroidSize fragmentSize = rock->size == AsteroidSize::Large ? AsteroidSize::Medium : AsteroidSize::Small;
    float offsetDistance = AsteroidComponent::RadiusFor(rock->size) * 0.5f;
    glm::vec2 origin = transform->getPosition();

    for (int i = 0; i < ASTEROID_FRAGMENTS; ++i) {
        float speed = difficulty.GetAsteroidSpeed(random.Range(50.0f, 150.0f));
        glm::vec2 velocity = Vec2::FromAngle(random.Angle(), speed);

        float offsetAngle = (static_cast<float>(i) / ASTEROID_FRAGMENTS) * glm::two_pi<float>();
        glm::vec2 position = origin + Vec2::FromAngle(offsetAngle, offsetDistance);

        fragments.push_back(CreateAsteroid(entityManager, random, fragmentSize, position, velocity));
    }
    return fragments;
}

Entity CreateBullet(EntityManager& entityManager, const BulletSpec& spec) {
    Entity bullet = entityManager.CreateEntity();
    entityManager.AddComponent<Transform>(bullet, spec.position, spec.angle);
    entityManager.AddComponent<Kinematics>(bullet, Vec2::FromAngle(spec.angle, BulletComponent::SPEED), WrapMode::Wrap);
    AddCollider(entityManager, bullet,
                spec.piercing ? BulletComponent::PIERCING_RADIUS : BulletComponent::RADIUS,
                CollisionLayer::BULLET);
    entityManager.AddComponent<BulletComponent>(bullet, spec.damage, spec.piercing);
    return bullet;
}

Entity CreateEnemy(EntityManager& entityManager, Random& random, EnemyType type,
                   const glm::vec2& position, float speedMultiplier) {
    Entity enemy = entityManager.CreateEntity();
    EnemyComponent* ai = entityManager.AddComponent<EnemyComponent>(enemy, type, speedMultiplier);

    float heading = random.Angle();
    entityManager.AddComponent<Transform>(enemy, position, heading);
    entityManager.AddComponent<Kinematics>(enemy, Vec2::FromAngle(heading, ai->speed), WrapMode::Wrap);
    AddCollider(entityManager, enemy, GetEnemyStats(type).size, CollisionLayer::ENEMY);
    return enemy;
}

Entity CreateBoss(EntityManager& entityManager, BossType type, const glm::vec2& position) {
    Entity boss = entityManager.CreateEntity();
    entityManager.AddComponent<Transform>(boss, position, 0.0f);
    entityManager.AddComponent<Kinematics>(boss, glm::vec2(0.0f), WrapMode::Clamp);
    AddCollider(entityManager, boss, GetBossStats(type).size, CollisionLayer::BOSS);
    entityManager.AddComponent<BossComponent>(boss, type, position);
    return boss;
}

Entity CreateBossProjectile(EntityManager& entityManager, const glm::vec2& position, const glm::vec2& direction) {
    Entity projectile = entityManager.CreateEntity();
    entityManager.AddComponent<Transform>(projectile, position, Vec2::Angle(direction));
    entityManager.AddComponent<Kinematics>(projectile,
        Vec2::Normalize(direction) * BossProjectileComponent::SPEED, WrapMode::Cull);
    AddCollider(entityManager, projectile, BossProjectileComponent::RADIUS, CollisionLayer::BOSS_PROJECTILE);
    entityManager.AddComponent<BossProjectileComponent>(projectile);
    return projectile;
}

Entity CreateHomingMissile(EntityManager& entityManager, const glm::vec2& position, float heading) {
    Entity missile = entityManager.CreateEntity();
    entityManager.AddComponent<Transform>(missile, position, heading);
    // Missiles wrap at the bare world edge, handled by their own system
    entityManager.AddComponent<Kinematics>(missile, Vec2::FromAngle(heading, HomingMissileComponent::SPEED), WrapMode::None);
    AddCollider(entityManager, missile, HomingMissileComponent::RADIUS, CollisionLayer::MISSILE);
    entityManager.AddComponent<HomingMissileComponent>(missile);
    return missile;
}

Entity CreatePowerUp(EntityManager& entityManager, Random& random, PowerUpType type, const glm::vec2& position) {
    glm::vec2 drift((random.Next() - 0.5f) * 20.0f, (random.Next() - 0.5f) * 20.0f);

    Entity powerUp = entityManager.CreateEntity();
    entityManager.AddComponent<Transform>(powerUp, position, 0.0f);
    entityManager.AddComponent<Kinematics>(powerUp, drift, WrapMode::Wrap);
    AddCollider(entityManager, powerUp, PowerUpComponent::RADIUS, CollisionLayer::PICKUP);
    entityManager.AddComponent<PowerUpComponent>(powerUp, type);
    return powerUp;
}

PowerUpType RandomClassicPowerUp(Random& random) {
    return CLASSIC_POWER_UPS[random.RangeInt(0, static_cast<int>(CLASSIC_POWER_UPS.size()) - 1)];
}

Entity CreateShield(EntityManager& entityManager, Entity ship, float durationMs) {
    if (!entityManager.IsActive(ship)) {
        return NULL_ENTITY;
    }

    const Transform* shipTransform = entityManager.GetComponent<Transform>(ship);
    const CircleCollider2D* shipCollider = entityManager.GetComponent<CircleCollider2D>(ship);
    if (!shipTransform || !shipCollider) {
        return NULL_ENTITY;
    }

    Entity shield = entityManager.CreateEntity();
    entityManager.AddComponent<Transform>(shield, shipTransform->getPosition(), 0.0f);
    AddCollider(entityManager, shield, shipCollider->radius + ShieldComponent::RADIUS_PADDING, CollisionLayer::SHIELD);
    entityManager.AddComponent<ShieldComponent>(shield, entityManager.GetHandle(ship), durationMs);
    return shield;
}
