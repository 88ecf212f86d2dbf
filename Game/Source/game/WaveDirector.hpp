#pragma once

#include "Components.hpp"
#include "GameConfig.hpp"
#include "Utils/Random.hpp"
#include <glm/glm.hpp>
#include <optional>
#include <vector>

struct SpawnGroup {
    EnemyType type;
    int count;
    float spawnDelayMs;
};

struct WaveConfig {
    int waveNumber = 0;
    std::vector<SpawnGroup> groups;
    int totalEnemies = 0;
    int bonusScore = 0;
    bool bossWave = false;
};

enum class WaveState : uint8_t {
    Idle,
    Spawning,
    BossIntro,
    AllSpawned,   // waiting for the field to be cleared
    Complete      // counting down to the next wave
};

struct EnemySpawnRequest {
    EnemyType type;
    glm::vec2 position;
};

// What the orchestrator has to materialize after a director tick
struct WaveTickResult {
    std::vector<EnemySpawnRequest> enemiesToSpawn;
    bool waveStarted = false;
    bool bossIntroStarted = false;
    bool spawnBoss = false;
};

// Schedules enemy spawn groups for each wave, gates boss encounters and
// decides when a wave is cleared. It never touches entities itself.
class WaveDirector {
public:
    WaveDirector(const GameConfig& config, Random& random);

    void Reset();

    // Builds the wave and enters Spawning, or BossIntro on boss waves
    void StartWave(int waveNumber);

    WaveTickResult Tick(float deltaMs, const std::optional<glm::vec2>& playerPosition);

    // All groups spawned (or the boss spawned and defeated) and no enemy alive
    bool IsWaveComplete(size_t liveEnemyCount) const;

    // Moves to Complete, schedules the next wave and returns the wave bonus
    int CompleteWave();

    void OnEnemyDestroyed();
    void OnBossDefeated();

    bool IsBossWave(int waveNumber) const;
    bool IsBossAlive() const { return bossAlive; }

    // Random point just outside a random edge, kept away from the player.
    // Falls back to the top-center point after the bounded number of attempts.
    glm::vec2 ChooseSpawnPosition(const std::optional<glm::vec2>& playerPosition);
    glm::vec2 GetFallbackSpawnPosition() const;

    static WaveConfig GenerateWaveConfig(int waveNumber);

    WaveState GetState() const { return state; }
    int GetCurrentWave() const { return currentWave; }
    int GetEnemiesRemaining() const { return enemiesRemaining; }
    int GetTotalEnemies() const { return config.totalEnemies; }
    float GetWaveProgress() const;
    const WaveConfig& GetCurrentConfig() const { return config; }

private:
    const GameConfig& gameConfig;
    Random& random;

    WaveState state = WaveState::Idle;
    WaveConfig config;
    int currentWave = 0;
    int enemiesRemaining = 0;
    size_t currentGroup = 0;
    int spawnedInGroup = 0;
    float spawnTimerMs = 0.0f;
    float stateTimerMs = 0.0f;
    bool announcePending = false;
    bool bossAlive = false;
    bool bossDefeated = false;
};
