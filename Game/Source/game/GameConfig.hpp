#pragma once

#include "Difficulty.hpp"

// Every tunable of a game session. Passed to the director and the spawn routines.
struct GameConfig {
    float worldWidth;
    float worldHeight;
    int startingLives;
    int startingLevel;

    float respawnDelayMs;
    float respawnRetryMs;        // timer value after an unsafe respawn attempt
    float respawnSafeRadius;     // no asteroid this close to the center

    int bossInterval;            // every Nth wave is a boss wave
    float bossIntroMs;
    float nextWaveDelayMs;

    float spawnEdgeMargin;
    float minSpawnDistance;      // from the player
    int spawnAttempts;

    float powerUpSpawnIntervalMs;
    float timedPowerUpChance;
    float asteroidDropChance;

    float maxDeltaMs;
    int levelBonusPerLevel;

    DifficultyLevel difficulty;

    GameConfig(float width = 800.0f, float height = 600.0f, DifficultyLevel d = DifficultyLevel::Normal)
        : worldWidth(width)
        , worldHeight(height)
        , startingLives(3)
        , startingLevel(1)
        , respawnDelayMs(3000.0f)
        , respawnRetryMs(2500.0f)
        , respawnSafeRadius(100.0f)
        , bossInterval(5)
        , bossIntroMs(3000.0f)
        , nextWaveDelayMs(3000.0f)
        , spawnEdgeMargin(50.0f)
        , minSpawnDistance(150.0f)
        , spawnAttempts(20)
        , powerUpSpawnIntervalMs(7000.0f)
        , timedPowerUpChance(0.3f)
        , asteroidDropChance(0.15f)
        , maxDeltaMs(100.0f)
        , levelBonusPerLevel(1000)
        , difficulty(d)
    {}
};
