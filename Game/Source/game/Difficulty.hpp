#pragma once

#include <optional>
#include <string>

enum class DifficultyLevel {
    Easy,
    Normal,
    Hard,
    Insane
};

// Multipliers read by spawn and scoring decisions. Never mutated by the simulation.
struct DifficultySettings {
    float asteroidSpeedMultiplier;
    float asteroidSpawnRate;
    float enemySpawnRate;
    float enemySpeedMultiplier;
    float playerHealthMultiplier;
    float scoreMultiplier;
    float powerUpSpawnRate;
    int maxAsteroidsOnScreen;
    float waveProgressionSpeed;
    float shieldDurationMultiplier;
};

class DifficultyManager {
public:
    explicit DifficultyManager(DifficultyLevel level = DifficultyLevel::Normal);

    void SetLevel(DifficultyLevel newLevel) { level = newLevel; }
    DifficultyLevel GetLevel() const { return level; }
    const DifficultySettings& GetSettings() const;

    int GetScoreValue(float baseScore) const;
    float GetAsteroidSpeed(float baseSpeed) const;
    // roll is a uniform sample in [0, 1)
    bool ShouldSpawnPowerUp(float baseChance, float roll) const;
    float GetShieldDuration(float baseDuration) const;

    static const DifficultySettings& SettingsFor(DifficultyLevel level);
    static const char* LevelName(DifficultyLevel level);
    // Case-insensitive; unknown names give std::nullopt
    static std::optional<DifficultyLevel> ParseLevel(const std::string& name);

private:
    DifficultyLevel level;
};
