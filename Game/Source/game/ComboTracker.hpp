#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

enum class AchievementKind : uint8_t {
    Combo,
    KillStreak,
    PowerUpStreak,
    WaveCleared,
    BossKill
};

struct Achievement {
    AchievementKind kind;
    std::string text;
    int points;
};

// Time-decaying combo counter with its score multiplier, plus kill and
// power-up streak milestones. Thresholds are matched by exact equality.
class ComboTracker {
public:
    static constexpr float STREAK_TIMEOUT_MS = 5000.0f;
    static constexpr float COMBO_GRACE_MS = 3000.0f;
    static constexpr float COMBO_DECAY_INTERVAL_MS = 100.0f;
    static constexpr float MAX_COMBO_MULTIPLIER = 10.0f;
    static constexpr int MIN_SIGNIFICANT_COMBO = 5;

    static constexpr std::array<int, 6> COMBO_THRESHOLDS = { 5, 10, 15, 25, 50, 100 };
    static constexpr std::array<int, 6> KILL_STREAK_THRESHOLDS = { 10, 20, 30, 50, 80, 100 };
    static constexpr std::array<int, 3> POWER_UP_STREAK_THRESHOLDS = { 3, 5, 8 };

    // Decays the combo by one per interval once idle past the grace window
    void Tick(float deltaMs, float nowMs);

    // Combo milestones are reported before kill-streak milestones
    std::optional<Achievement> OnKill(float nowMs);

    // Breaks the combo only when it was significant
    void OnMiss();

    std::optional<Achievement> OnPowerUpCollected();
    Achievement OnWaveCleared(int wave) const;
    Achievement OnBossKilled() const;

    // Ship death
    void ResetStreaks();

    int GetComboCount() const { return comboCount; }
    float GetComboMultiplier() const { return MultiplierFor(comboCount); }
    int GetKillStreak() const { return killStreak; }
    int GetPowerUpStreak() const { return powerUpStreak; }

    // 1 + floor(count / 5) * 0.5, capped
    static float MultiplierFor(int comboCount);

private:
    int comboCount = 0;
    int killStreak = 0;
    int powerUpStreak = 0;
    float lastKillMs = 0.0f;
    float lastComboMs = 0.0f;
    float decayTimerMs = 0.0f;
};
