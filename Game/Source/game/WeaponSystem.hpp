#pragma once

#include "PowerUps.hpp"
#include <glm/glm.hpp>
#include <map>
#include <optional>
#include <vector>

enum class FirePattern : uint8_t {
    Single,
    Triple,
    Spread
};

// What the next shot looks like given the active effects
struct FireSpec {
    int bulletCount;
    FirePattern pattern;
    bool piercing;
    float damageMultiplier;
    float cooldownMs;
};

// One bullet to materialize
struct BulletSpec {
    glm::vec2 position;
    float angle;
    float damage;
    bool piercing;
};

struct ActiveEffect {
    PowerUpType type;
    float remainingMs;
};

// Ledger of timed weapon effects: at most one entry per kind, re-adding a kind
// replaces its timer. Also owns the fire cooldown and homing missile charges.
class WeaponSystem {
public:
    static constexpr float BASE_COOLDOWN_MS = 250.0f;
    static constexpr float RAPID_FIRE_FACTOR = 0.3f;
    static constexpr float TRIPLE_SHOT_ANGLE = 0.2f;
    static constexpr float SPREAD_SHOT_ANGLE = 0.15f;
    static constexpr float POWER_SHOT_DAMAGE = 2.0f;
    static constexpr float BASE_DAMAGE = 1.0f;
    static constexpr int HOMING_MISSILE_CHARGES = 3;

    // Ages every entry and drops the ones that ran out
    void Advance(float deltaMs);

    // Replace-or-insert. Only ledger kinds are accepted; others are a configuration error.
    void AddPowerUp(PowerUpType type, float durationMs);

    bool HasPowerUp(PowerUpType type) const;
    float GetRemainingTime(PowerUpType type) const;

    // SpreadShot wins over TripleShot when both are active
    FireSpec GetCurrentFireSpec() const;

    bool CanFire(float nowMs) const;

    // Bullets actually fired; empty while cooling down. Only a real shot stamps the fire time.
    std::vector<BulletSpec> Shoot(float nowMs, const glm::vec2& origin, float heading);

    // Consumes one charge; false when none is left
    bool LaunchHomingMissile();
    int GetHomingMissileCharges() const { return homingMissileCharges; }

    std::vector<ActiveEffect> GetActiveEffects() const;
    const char* GetFireSound() const;

    void Reset();

private:
    std::map<PowerUpType, float> activeEffects;
    std::optional<float> lastFireMs;
    int homingMissileCharges = 0;
};
