#include "WeaponSystem.hpp"
#include "Utils/Debug/Debug.hpp"

void WeaponSystem::Advance(float deltaMs) {
    for (auto it = activeEffects.begin(); it != activeEffects.end();) {
        it->second -= deltaMs;
        if (it->second <= 0.0f) {
            if (it->first == PowerUpType::HomingMissile) {
                homingMissileCharges = 0;
            }
            Debug::Info("WeaponSystem") << PowerUpName(it->first) << " expired\n";
            it = activeEffects.erase(it);
        } else {
            ++it;
        }
    }
}

void WeaponSystem::AddPowerUp(PowerUpType type, float durationMs) {
    const PowerUpConfig* config = FindPowerUpConfig(type);
    if (!config) {
        return;
    }
    if (config->route != PowerUpRoute::Ledger) {
        ReportConfigurationError(std::string(config->name) + " is not a timed weapon effect");
        return;
    }

    activeEffects[type] = durationMs;

    if (type == PowerUpType::HomingMissile) {
        homingMissileCharges = HOMING_MISSILE_CHARGES;
    }
}

bool WeaponSystem::HasPowerUp(PowerUpType type) const {
    return activeEffects.find(type) != activeEffects.end();
}

float WeaponSystem::GetRemainingTime(PowerUpType type) const {
    auto it = activeEffects.find(type);
    return it != activeEffects.end() ? it->second : 0.0f;
}

FireSpec WeaponSystem::GetCurrentFireSpec() const {
    FireSpec spec{ 1, FirePattern::Single, false, 1.0f, BASE_COOLDOWN_MS };

    if (HasPowerUp(PowerUpType::RapidFire)) {
        spec.cooldownMs = BASE_COOLDOWN_MS * RAPID_FIRE_FACTOR;
    }

    if (HasPowerUp(PowerUpType::SpreadShot)) {
        spec.pattern = FirePattern::Spread;
        spec.bulletCount = 5;
    } else if (HasPowerUp(PowerUpType::TripleShot)) {
        spec.pattern = FirePattern::Triple;
        spec.bulletCount = 3;
    }

    if (HasPowerUp(PowerUpType::PowerShot)) {
        spec.piercing = true;
        spec.damageMultiplier = POWER_SHOT_DAMAGE;
    }

    return spec;
}

bool WeaponSystem::CanFire(float nowMs) const {
    if (!lastFireMs) {
        return true;
    }
    return nowMs - *lastFireMs >= GetCurrentFireSpec().cooldownMs;
}

std::vector<BulletSpec> WeaponSystem::Shoot(float nowMs, const glm::vec2& origin, float heading) {
    std::vector<BulletSpec> bullets;
    if (!CanFire(nowMs)) {
        return bullets;
    }

    FireSpec spec = GetCurrentFireSpec();
    float damage = BASE_DAMAGE * spec.damageMultiplier;

    switch (spec.pattern) {
    case FirePattern::Single:
        bullets.push_back({ origin, heading, damage, spec.piercing });
        break;
    case FirePattern::Triple:
        for (int i = -1; i <= 1; ++i) {
            bullets.push_back({ origin, heading + i * TRIPLE_SHOT_ANGLE, damage, spec.piercing });
        }
        break;
    case FirePattern::Spread:
        for (int i = -2; i <= 2; ++i) {
            bullets.push_back({ origin, heading + i * SPREAD_SHOT_ANGLE, damage, spec.piercing });
        }
        break;
    }

    lastFireMs = nowMs;
    return bullets;
}

bool WeaponSystem::LaunchHomingMissile() {
    if (homingMissileCharges <= 0) {
        return false;
    }
    homingMissileCharges--;
    return true;
}

std::vector<ActiveEffect> WeaponSystem::GetActiveEffects() const {
    std::vector<ActiveEffect> effects;
    effects.reserve(activeEffects.size());
    for (const auto& [type, remaining] : activeEffects) {
        effects.push_back({ type, remaining });
    }
    return effects;
}

const char* WeaponSystem::GetFireSound() const {
    if (HasPowerUp(PowerUpType::RapidFire)) {
        return "rapidFire";
    }
    if (HasPowerUp(PowerUpType::TripleShot) || HasPowerUp(PowerUpType::SpreadShot)) {
        return "tripleFire";
    }
    return "shoot";
}

void WeaponSystem::Reset() {
    activeEffects.clear();
    lastFireMs.reset();
    homingMissileCharges = 0;
}
