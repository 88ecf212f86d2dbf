#include "Boss.hpp"
#include "Math/Vector2.hpp"
#include <glm/gtc/constants.hpp>

namespace {

const BossStats MOTHERSHIP_STATS      = { 100.0f,  80.0f, 60.0f, 5000, 2000.0f, 3000.0f };
const BossStats FORTRESS_STATS        = { 150.0f,  50.0f, 80.0f, 7500, 1500.0f, 4000.0f };
const BossStats SWARM_COMMANDER_STATS = {  80.0f, 120.0f, 50.0f, 4000, 3000.0f, 1500.0f };

}

const BossStats& GetBossStats(BossType type) {
    switch (type) {
    case BossType::Mothership:     return MOTHERSHIP_STATS;
    case BossType::Fortress:       return FORTRESS_STATS;
    case BossType::SwarmCommander: return SWARM_COMMANDER_STATS;
    }
    return MOTHERSHIP_STATS;
}

const char* BossName(BossType type) {
    switch (type) {
    case BossType::Mothership:     return "Mothership";
    case BossType::Fortress:       return "Fortress";
    case BossType::SwarmCommander: return "Swarm Commander";
    }
    return "Boss";
}

BossType BossTypeForWave(int wave) {
    if (wave % 15 == 0) return BossType::Fortress;
    if (wave % 10 == 0) return BossType::SwarmCommander;
    return BossType::Mothership;
}

BossComponent::BossComponent(BossType t, const glm::vec2& start)
    : type(t)
    , health(GetBossStats(t).maxHealth)
    , maxHealth(GetBossStats(t).maxHealth)
    , attackCooldownMs(GetBossStats(t).attackCooldownMs)
    , attackTimerMs(0.0f)
    , moveTimerMs(0.0f)
    , moveTarget(start)
    , phase(0)
{}

bool BossComponent::TakeDamage(float amount) {
    health -= amount;

    // Phases only ever go up; each step speeds up the attacks
    float ratio = GetHealthRatio();
    if (phase == 0 && ratio < PHASE_ONE_RATIO) {
        phase = 1;
        attackCooldownMs *= PHASE_ONE_COOLDOWN_FACTOR;
    }
    if (phase == 1 && ratio < PHASE_TWO_RATIO) {
        phase = 2;
        attackCooldownMs *= PHASE_TWO_COOLDOWN_FACTOR;
    }

    return health <= 0.0f;
}

std::vector<glm::vec2> BossComponent::GetAttackPattern(float heading, Random& random) const {
    std::vector<glm::vec2> directions;

    switch (type) {
    case BossType::Mothership: {
        int count = 8 + phase * 4;
        for (int i = 0; i < count; ++i) {
            float angle = glm::two_pi<float>() / count * i + heading;
            directions.push_back(Vec2::FromAngle(angle));
        }
        break;
    }
    case BossType::Fortress: {
        directions = { {1.0f, 0.0f}, {-1.0f, 0.0f}, {0.0f, 1.0f}, {0.0f, -1.0f} };
        if (phase >= 1) {
            const float d = glm::one_over_root_two<float>();
            directions.push_back({ d, d });
            directions.push_back({ -d, d });
            directions.push_back({ d, -d });
            directions.push_back({ -d, -d });
        }
        break;
    }
    case BossType::SwarmCommander: {
        int count = 3 + phase * 2;
        for (int i = 0; i < count; ++i) {
            directions.push_back(Vec2::FromAngle(random.Angle()));
        }
        break;
    }
    }

    return directions;
}

glm::vec2 BossComponent::PickMoveTarget(float worldWidth, float worldHeight, Random& random) const {
    switch (type) {
    case BossType::Mothership: {
        // Somewhere on a circle around the center
        glm::vec2 center(worldWidth / 2.0f, worldHeight / 2.0f);
        return center + Vec2::FromAngle(random.Angle(), 200.0f);
    }
    case BossType::Fortress:
        return glm::vec2(random.Range(100.0f, worldWidth - 100.0f),
                         random.Range(100.0f, worldHeight - 100.0f));
    case BossType::SwarmCommander:
        return glm::vec2(random.Range(0.0f, worldWidth), random.Range(0.0f, worldHeight));
    }
    return moveTarget;
}
