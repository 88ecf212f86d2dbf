#pragma once

#include "ecs/ecs_common.hpp"
#include "Utils/Random.hpp"
#include <vector>

enum class BossType : uint8_t {
    Mothership,
    Fortress,
    SwarmCommander
};

struct BossStats {
    float maxHealth;
    float speed;
    float size;
    int score;
    float attackCooldownMs;
    float retargetIntervalMs;
};

const BossStats& GetBossStats(BossType type);
const char* BossName(BossType type);

// Every 15th wave brings a Fortress, every 10th a Swarm Commander, the rest a Mothership
BossType BossTypeForWave(int wave);

// Boss state machine: Active(phase 0..2) until health reaches zero.
// The boss never destroys itself; the caller handles cleanup and rewards.
class BossComponent : public IComponent {
public:
    static constexpr float BULLET_DAMAGE = 10.0f;
    static constexpr float PHASE_ONE_RATIO = 0.5f;
    static constexpr float PHASE_TWO_RATIO = 0.25f;
    static constexpr float PHASE_ONE_COOLDOWN_FACTOR = 0.8f;
    static constexpr float PHASE_TWO_COOLDOWN_FACTOR = 0.7f;
    static constexpr float ARRIVE_DISTANCE = 10.0f;
    static constexpr int MAX_PHASE = 2;

    BossType type;
    float health;
    float maxHealth;
    float attackCooldownMs;
    float attackTimerMs;
    float moveTimerMs;
    glm::vec2 moveTarget;

    BossComponent() : BossComponent(BossType::Mothership, glm::vec2(0.0f)) {}
    BossComponent(BossType t, const glm::vec2& start);

    // Applies damage and escalates the phase. True when health reached zero.
    bool TakeDamage(float amount);

    bool CanAttack() const { return attackTimerMs >= attackCooldownMs; }
    void ResetAttackTimer() { attackTimerMs = 0.0f; }

    int GetPhase() const { return phase; }
    float GetHealthRatio() const { return maxHealth > 0.0f ? health / maxHealth : 0.0f; }
    bool IsDestroyed() const { return health <= 0.0f; }

    // Unit directions of the next volley
    std::vector<glm::vec2> GetAttackPattern(float heading, Random& random) const;

    glm::vec2 PickMoveTarget(float worldWidth, float worldHeight, Random& random) const;

private:
    int phase;
};
