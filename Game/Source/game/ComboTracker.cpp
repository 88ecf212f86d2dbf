#include "ComboTracker.hpp"
#include <algorithm>

namespace {

std::string ComboTitle(int combo) {
    switch (combo) {
    case 25:  return "MEGA COMBO x25!";
    case 50:  return "ULTRA COMBO x50!";
    case 100: return "GODLY COMBO x100!";
    default:  return "COMBO x" + std::to_string(combo) + "!";
    }
}

std::string KillStreakTitle(int streak) {
    switch (streak) {
    case 10:  return "KILLING SPREE!";
    case 20:  return "RAMPAGE!";
    case 30:  return "DOMINATING!";
    case 50:  return "UNSTOPPABLE!";
    case 80:  return "GODLIKE!";
    case 100: return "LEGENDARY!";
    default:  return std::to_string(streak) + " KILL STREAK!";
    }
}

std::string PowerUpStreakTitle(int streak) {
    switch (streak) {
    case 3:  return "POWER-UP MANIAC!";
    case 5:  return "COLLECTOR!";
    case 8:  return "POWER MASTER!";
    default: return "POWER STREAK x" + std::to_string(streak) + "!";
    }
}

template<size_t N>
bool IsThreshold(const std::array<int, N>& thresholds, int value) {
    return std::find(thresholds.begin(), thresholds.end(), value) != thresholds.end();
}

}

void ComboTracker::Tick(float deltaMs, float nowMs) {
    if (nowMs - lastComboMs <= COMBO_GRACE_MS) {
        return;
    }

    decayTimerMs += deltaMs;
    if (decayTimerMs >= COMBO_DECAY_INTERVAL_MS) {
        if (comboCount > 0) {
            comboCount--;
        }
        decayTimerMs = 0.0f;
    }
}

std::optional<Achievement> ComboTracker::OnKill(float nowMs) {
    if (nowMs - lastKillMs > STREAK_TIMEOUT_MS) {
        killStreak = 0;
    }

    killStreak++;
    lastKillMs = nowMs;

    comboCount++;
    lastComboMs = nowMs;
    decayTimerMs = 0.0f;

    if (IsThreshold(COMBO_THRESHOLDS, comboCount)) {
        return Achievement{ AchievementKind::Combo, ComboTitle(comboCount), comboCount * 10 };
    }

    if (IsThreshold(KILL_STREAK_THRESHOLDS, killStreak)) {
        return Achievement{ AchievementKind::KillStreak, KillStreakTitle(killStreak), killStreak * 50 };
    }

    return std::nullopt;
}

void ComboTracker::OnMiss() {
    if (comboCount >= MIN_SIGNIFICANT_COMBO) {
        comboCount = 0;
    }
}

std::optional<Achievement> ComboTracker::OnPowerUpCollected() {
    powerUpStreak++;

    if (IsThreshold(POWER_UP_STREAK_THRESHOLDS, powerUpStreak)) {
        return Achievement{ AchievementKind::PowerUpStreak, PowerUpStreakTitle(powerUpStreak), powerUpStreak * 25 };
    }

    return std::nullopt;
}

Achievement ComboTracker::OnWaveCleared(int wave) const {
    return Achievement{ AchievementKind::WaveCleared, "WAVE " + std::to_string(wave) + " CLEARED!", wave * 100 };
}

Achievement ComboTracker::OnBossKilled() const {
    return Achievement{ AchievementKind::BossKill, "BOSS ELIMINATED!", 1000 };
}

void ComboTracker::ResetStreaks() {
    killStreak = 0;
    powerUpStreak = 0;
    comboCount = 0;
    lastComboMs = 0.0f;
    decayTimerMs = 0.0f;
}

float ComboTracker::MultiplierFor(int comboCount) {
    float multiplier = 1.0f + static_cast<float>(comboCount / 5) * 0.5f;
    return std::min(multiplier, MAX_COMBO_MULTIPLIER);
}
