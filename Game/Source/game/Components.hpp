#ifndef COMPONENTS_STARFALL
#define COMPONENTS_STARFALL

#include "ecs/ecs_common.hpp"
#include "PowerUps.hpp"
#include <algorithm>
#include <set>
#include <vector>


class ShipComponent : public IComponent {
public:
    static constexpr float RADIUS = 8.0f;
    static constexpr float MAX_SPEED = 300.0f;
    static constexpr float THRUST_POWER = 200.0f;     // px/s^2
    static constexpr float ROTATION_SPEED = 3.0f;     // rad/s
    static constexpr float FRICTION = 0.98f;          // per tick
    static constexpr float SPAWN_INVULNERABILITY_MS = 1500.0f;
    static constexpr float FRONT_OFFSET = 12.0f;

    float thrust;       // 0..1, consumed by the next update
    float turn;         // -1..1, consumed by the next update
    float invulnerableMs;

    ShipComponent() : thrust(0.0f), turn(0.0f), invulnerableMs(SPAWN_INVULNERABILITY_MS) {}

    void SetThrust(float value) { thrust = std::clamp(value, 0.0f, 1.0f); }
    void SetTurn(float value) { turn = std::clamp(value, -1.0f, 1.0f); }

    void MakeInvulnerable(float durationMs = SPAWN_INVULNERABILITY_MS) {
        invulnerableMs = std::max(invulnerableMs, durationMs);
    }
    bool CanTakeDamage() const { return invulnerableMs <= 0.0f; }
};

enum class AsteroidSize : uint8_t {
    Large,
    Medium,
    Small
};

class AsteroidComponent : public IComponent {
public:
    AsteroidSize size;
    float spin;                        // rad/s
    std::vector<glm::vec2> outline;    // local-space polygon, generated once

    AsteroidComponent() : size(AsteroidSize::Large), spin(0.0f) {}
    AsteroidComponent(AsteroidSize s, float sp, std::vector<glm::vec2> o)
        : size(s), spin(sp), outline(std::move(o)) {}

    static float RadiusFor(AsteroidSize size) {
        switch (size) {
        case AsteroidSize::Large:  return 40.0f;
        case AsteroidSize::Medium: return 25.0f;
        case AsteroidSize::Small:  return 15.0f;
        }
        return 40.0f;
    }

    static int ScoreFor(AsteroidSize size) {
        switch (size) {
        case AsteroidSize::Large:  return 20;
        case AsteroidSize::Medium: return 50;
        case AsteroidSize::Small:  return 100;
        }
        return 20;
    }

    int GetScore() const { return ScoreFor(size); }
};

class BulletComponent : public IComponent {
public:
    static constexpr float RADIUS = 2.0f;
    static constexpr float PIERCING_RADIUS = 3.0f;
    static constexpr float SPEED = 400.0f;
    static constexpr float LIFETIME_MS = 2000.0f;

    float damage;
    bool piercing;
    float ageMs;
    std::set<EntityHandle> pierced;   // targets already damaged during this flight

    BulletComponent() : damage(1.0f), piercing(false), ageMs(0.0f) {}
    BulletComponent(float d, bool p) : damage(d), piercing(p), ageMs(0.0f) {}

    bool HasPierced(const EntityHandle& target) const { return pierced.count(target) > 0; }
    void MarkPierced(const EntityHandle& target) { pierced.insert(target); }
};

enum class EnemyType : uint8_t {
    Scout,
    Fighter,
    Bomber
};

struct EnemyStats {
    int health;
    float speed;
    int score;
    float size;
    float aggressiveness;   // share of full speed used while chasing
};

inline const EnemyStats& GetEnemyStats(EnemyType type) {
    static const EnemyStats SCOUT   = { 1, 120.0f, 100,  8.0f, 0.7f };
    static const EnemyStats FIGHTER = { 2,  80.0f, 200, 12.0f, 0.8f };
    static const EnemyStats BOMBER  = { 3,  50.0f, 300, 16.0f, 0.5f };
    switch (type) {
    case EnemyType::Scout:   return SCOUT;
    case EnemyType::Fighter: return FIGHTER;
    case EnemyType::Bomber:  return BOMBER;
    }
    return SCOUT;
}

class EnemyComponent : public IComponent {
public:
    static constexpr float WANDER_INTERVAL_MS = 1000.0f;
    static constexpr float TURN_SPEED = 2.0f;

    EnemyType type;
    int health;
    float speed;         // already scaled by the difficulty
    float wanderAngle;
    float wanderTimeMs;

    EnemyComponent() : EnemyComponent(EnemyType::Scout, 1.0f) {}
    EnemyComponent(EnemyType t, float speedMultiplier)
        : type(t)
        , health(GetEnemyStats(t).health)
        , speed(GetEnemyStats(t).speed * speedMultiplier)
        , wanderAngle(0.0f)
        , wanderTimeMs(0.0f) {}

    // Returns true once health reaches zero
    bool TakeDamage(int amount = 1) {
        health -= amount;
        return health <= 0;
    }

    int GetScore() const { return GetEnemyStats(type).score; }
};

class BossProjectileComponent : public IComponent {
public:
    static constexpr float RADIUS = 6.0f;
    static constexpr float SPEED = 200.0f;
    static constexpr float LIFETIME_MS = 5000.0f;

    float ageMs;

    BossProjectileComponent() : ageMs(0.0f) {}
};

class HomingMissileComponent : public IComponent {
public:
    static constexpr float RADIUS = 3.0f;
    static constexpr float SPEED = 150.0f;
    static constexpr float TURN_SPEED = 3.0f;
    static constexpr float LIFETIME_MS = 8000.0f;

    EntityHandle target;   // weak; re-acquired when stale
    float ageMs;

    HomingMissileComponent() : ageMs(0.0f) {}
};

class PowerUpComponent : public IComponent {
public:
    static constexpr float RADIUS = 15.0f;
    static constexpr float FRICTION = 0.99f;

    PowerUpType type;

    PowerUpComponent() : type(PowerUpType::RapidFire) {}
    explicit PowerUpComponent(PowerUpType t) : type(t) {}
};

class ShieldComponent : public IComponent {
public:
    static constexpr int MAX_HIT_POINTS = 3;
    static constexpr float RADIUS_PADDING = 15.0f;
    static constexpr float PICKUP_DURATION_MS = 15000.0f;
    static constexpr float MANUAL_DURATION_MS = 20000.0f;

    EntityHandle owner;    // never owns the ship
    int hitPoints;
    int maxHitPoints;
    float remainingMs;

    ShieldComponent() : hitPoints(MAX_HIT_POINTS), maxHitPoints(MAX_HIT_POINTS), remainingMs(PICKUP_DURATION_MS) {}
    ShieldComponent(EntityHandle o, float durationMs)
        : owner(o), hitPoints(MAX_HIT_POINTS), maxHitPoints(MAX_HIT_POINTS), remainingMs(durationMs) {}

    // Absorbs one hit; true when the shield is used up
    bool TakeDamage() {
        hitPoints--;
        return hitPoints <= 0;
    }

    bool IsExpired() const { return hitPoints <= 0 || remainingMs <= 0.0f; }
};

#endif // COMPONENTS_STARFALL
