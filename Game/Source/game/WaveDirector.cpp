#include "WaveDirector.hpp"
#include "Math/Vector2.hpp"
#include "Utils/Debug/Debug.hpp"
#include <algorithm>
#include <cmath>

namespace {

int CeilShare(int total, float share) {
    return static_cast<int>(std::ceil(total * share));
}

void AddGroup(WaveConfig& config, EnemyType type, int count, float delayMs) {
    if (count > 0) {
        config.groups.push_back({ type, count, delayMs });
    }
}

}

WaveDirector::WaveDirector(const GameConfig& config, Random& random)
    : gameConfig(config), random(random) {
}

void WaveDirector::Reset() {
    state = WaveState::Idle;
    config = WaveConfig{};
    currentWave = 0;
    enemiesRemaining = 0;
    currentGroup = 0;
    spawnedInGroup = 0;
    spawnTimerMs = 0.0f;
    stateTimerMs = 0.0f;
    announcePending = false;
    bossAlive = false;
    bossDefeated = false;
}

bool WaveDirector::IsBossWave(int waveNumber) const {
    return gameConfig.bossInterval > 0 && waveNumber > 0 && waveNumber % gameConfig.bossInterval == 0;
}

WaveConfig WaveDirector::GenerateWaveConfig(int waveNumber) {
    WaveConfig wave;
    wave.waveNumber = waveNumber;
    wave.bonusScore = waveNumber * 500;

    int enemies = std::min(3 + waveNumber, 15);

    if (waveNumber <= 3) {
        int scouts = CeilShare(enemies, 0.8f);
        AddGroup(wave, EnemyType::Scout, scouts, 800.0f);
        AddGroup(wave, EnemyType::Fighter, enemies - scouts, 1200.0f);
    } else if (waveNumber <= 7) {
        int scouts = CeilShare(enemies, 0.5f);
        int fighters = CeilShare(enemies, 0.4f);
        AddGroup(wave, EnemyType::Scout, scouts, 600.0f);
        AddGroup(wave, EnemyType::Fighter, fighters, 1000.0f);
        AddGroup(wave, EnemyType::Bomber, std::max(1, enemies - scouts - fighters), 1500.0f);
    } else {
        int scouts = CeilShare(enemies, 0.3f);
        int fighters = CeilShare(enemies, 0.4f);
        AddGroup(wave, EnemyType::Scout, scouts, 500.0f);
        AddGroup(wave, EnemyType::Fighter, fighters, 800.0f);
        AddGroup(wave, EnemyType::Bomber, enemies - scouts - fighters, 1200.0f);
    }

    for (const SpawnGroup& group : wave.groups) {
        wave.totalEnemies += group.count;
    }
    return wave;
}

void WaveDirector::StartWave(int waveNumber) {
    currentWave = waveNumber;
    currentGroup = 0;
    spawnedInGroup = 0;
    spawnTimerMs = 0.0f;
    stateTimerMs = 0.0f;
    announcePending = true;
    bossDefeated = false;

    if (IsBossWave(waveNumber)) {
        // The boss is the whole wave
        config = WaveConfig{};
        config.waveNumber = waveNumber;
        config.bonusScore = waveNumber * 500;
        config.totalEnemies = 1;
        config.bossWave = true;
        state = WaveState::BossIntro;
    } else {
        config = GenerateWaveConfig(waveNumber);
        state = config.groups.empty() ? WaveState::AllSpawned : WaveState::Spawning;
    }
    enemiesRemaining = config.totalEnemies;

    Debug::Info("WaveDirector") << "Wave " << waveNumber << " started: "
        << (config.bossWave ? "boss wave" : std::to_string(config.totalEnemies) + " enemies") << "\n";
}

WaveTickResult WaveDirector::Tick(float deltaMs, const std::optional<glm::vec2>& playerPosition) {
    WaveTickResult result;

    if (announcePending) {
        result.waveStarted = true;
        result.bossIntroStarted = (state == WaveState::BossIntro);
        announcePending = false;
    }

    switch (state) {
    case WaveState::Idle:
    case WaveState::AllSpawned:
        break;

    case WaveState::Spawning: {
        spawnTimerMs += deltaMs;
        const SpawnGroup& group = config.groups[currentGroup];
        if (spawnTimerMs >= group.spawnDelayMs) {
            result.enemiesToSpawn.push_back({ group.type, ChooseSpawnPosition(playerPosition) });
            spawnedInGroup++;
            spawnTimerMs = 0.0f;

            if (spawnedInGroup >= group.count) {
                currentGroup++;
                spawnedInGroup = 0;
                if (currentGroup >= config.groups.size()) {
                    state = WaveState::AllSpawned;
                }
            }
        }
        break;
    }

    case WaveState::BossIntro:
        stateTimerMs += deltaMs;
        if (stateTimerMs >= gameConfig.bossIntroMs) {
            result.spawnBoss = true;
            bossAlive = true;
            stateTimerMs = 0.0f;
            state = WaveState::AllSpawned;
            Debug::Info("WaveDirector") << "Boss spawn requested for wave " << currentWave << "\n";
        }
        break;

    case WaveState::Complete:
        stateTimerMs += deltaMs;
        if (stateTimerMs >= gameConfig.nextWaveDelayMs) {
            StartWave(currentWave + 1);
            result.waveStarted = true;
            result.bossIntroStarted = (state == WaveState::BossIntro);
            announcePending = false;
        }
        break;
    }

    return result;
}

bool WaveDirector::IsWaveComplete(size_t liveEnemyCount) const {
    if (state != WaveState::AllSpawned || liveEnemyCount > 0) {
        return false;
    }
    if (config.bossWave) {
        return bossDefeated && !bossAlive;
    }
    return true;
}

int WaveDirector::CompleteWave() {
    state = WaveState::Complete;
    stateTimerMs = 0.0f;
    Debug::Info("WaveDirector") << "Wave " << currentWave << " complete, bonus " << config.bonusScore << "\n";
    return config.bonusScore;
}

void WaveDirector::OnEnemyDestroyed() {
    if (enemiesRemaining > 0) {
        enemiesRemaining--;
    }
}

void WaveDirector::OnBossDefeated() {
    bossAlive = false;
    bossDefeated = true;
    OnEnemyDestroyed();
}

glm::vec2 WaveDirector::GetFallbackSpawnPosition() const {
    return glm::vec2(gameConfig.worldWidth / 2.0f, -gameConfig.spawnEdgeMargin);
}

glm::vec2 WaveDirector::ChooseSpawnPosition(const std::optional<glm::vec2>& playerPosition) {
    const float width = gameConfig.worldWidth;
    const float height = gameConfig.worldHeight;
    const float margin = gameConfig.spawnEdgeMargin;

    for (int attempt = 0; attempt < gameConfig.spawnAttempts; ++attempt) {
        glm::vec2 candidate;
        switch (random.RangeInt(0, 3)) {
        case 0:  candidate = glm::vec2(random.Range(0.0f, width), -margin); break;          // top
        case 1:  candidate = glm::vec2(width + margin, random.Range(0.0f, height)); break;  // right
        case 2:  candidate = glm::vec2(random.Range(0.0f, width), height + margin); break;  // bottom
        default: candidate = glm::vec2(-margin, random.Range(0.0f, height)); break;         // left
        }

        if (!playerPosition || Vec2::Distance(candidate, *playerPosition) >= gameConfig.minSpawnDistance) {
            return candidate;
        }
    }

    Debug::Warning("WaveDirector") << "No safe spawn position after " << gameConfig.spawnAttempts
        << " attempts, using fallback\n";
    return GetFallbackSpawnPosition();
}

float WaveDirector::GetWaveProgress() const {
    if (config.totalEnemies == 0) {
        return 1.0f;
    }
    return static_cast<float>(config.totalEnemies - enemiesRemaining) / config.totalEnemies;
}
