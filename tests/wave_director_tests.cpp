#include <gtest/gtest.h>

#include "game/WaveDirector.hpp"
#include "Math/Vector2.hpp"

namespace {

int CountOf(const WaveConfig& config, EnemyType type) {
    int count = 0;
    for (const SpawnGroup& group : config.groups) {
        if (group.type == type) {
            count += group.count;
        }
    }
    return count;
}

// Ticks until the director stops spawning, collecting every request
std::vector<EnemySpawnRequest> SpawnWholeWave(WaveDirector& director, float stepMs) {
    std::vector<EnemySpawnRequest> spawned;
    for (int i = 0; i < 10000 && director.GetState() == WaveState::Spawning; ++i) {
        WaveTickResult result = director.Tick(stepMs, std::nullopt);
        spawned.insert(spawned.end(), result.enemiesToSpawn.begin(), result.enemiesToSpawn.end());
    }
    return spawned;
}

}

// ===== Wave composition =====

TEST(WaveConfigTest, EarlyWavesAreMostlyScouts) {
    WaveConfig wave1 = WaveDirector::GenerateWaveConfig(1);
    EXPECT_EQ(wave1.totalEnemies, 4);
    EXPECT_EQ(wave1.bonusScore, 500);
    ASSERT_EQ(wave1.groups.size(), 1u);
    EXPECT_EQ(wave1.groups[0].type, EnemyType::Scout);
    EXPECT_FLOAT_EQ(wave1.groups[0].spawnDelayMs, 800.0f);

    WaveConfig wave3 = WaveDirector::GenerateWaveConfig(3);
    EXPECT_EQ(CountOf(wave3, EnemyType::Scout), 5);
    EXPECT_EQ(CountOf(wave3, EnemyType::Fighter), 1);
}

TEST(WaveConfigTest, MidWavesAlwaysBringABomber) {
    WaveConfig wave4 = WaveDirector::GenerateWaveConfig(4);
    EXPECT_EQ(CountOf(wave4, EnemyType::Scout), 4);
    EXPECT_EQ(CountOf(wave4, EnemyType::Fighter), 3);
    EXPECT_EQ(CountOf(wave4, EnemyType::Bomber), 1);
    EXPECT_EQ(wave4.totalEnemies, 8);
}

TEST(WaveConfigTest, LateWavesAreCappedAtFifteen) {
    WaveConfig wave8 = WaveDirector::GenerateWaveConfig(8);
    EXPECT_EQ(CountOf(wave8, EnemyType::Scout), 4);
    EXPECT_EQ(CountOf(wave8, EnemyType::Fighter), 5);
    EXPECT_EQ(CountOf(wave8, EnemyType::Bomber), 2);

    WaveConfig wave40 = WaveDirector::GenerateWaveConfig(40);
    EXPECT_EQ(wave40.totalEnemies, 15);
    EXPECT_EQ(wave40.bonusScore, 20000);
}

// ===== Spawning =====

TEST(WaveDirectorTest, SpawnsOneEnemyPerGroupDelay) {
    GameConfig config;
    Random random(1);
    WaveDirector director(config, random);
    director.StartWave(1);
    EXPECT_EQ(director.GetCurrentConfig().totalEnemies, 4);

    WaveTickResult first = director.Tick(799.0f, std::nullopt);
    EXPECT_TRUE(first.waveStarted);
    EXPECT_TRUE(first.enemiesToSpawn.empty());

    WaveTickResult second = director.Tick(1.0f, std::nullopt);
    EXPECT_FALSE(second.waveStarted);
    EXPECT_EQ(second.enemiesToSpawn.size(), 1u);
}

TEST(WaveDirectorTest, CompletesOnlyWhenEverythingSpawnedAndDied) {
    GameConfig config;
    Random random(2);
    WaveDirector director(config, random);
    director.StartWave(1);

    EXPECT_FALSE(director.IsWaveComplete(0));
    std::vector<EnemySpawnRequest> spawned = SpawnWholeWave(director, 100.0f);
    EXPECT_EQ(spawned.size(), 4u);
    EXPECT_EQ(director.GetState(), WaveState::AllSpawned);

    EXPECT_FALSE(director.IsWaveComplete(1));
    EXPECT_TRUE(director.IsWaveComplete(0));
    EXPECT_EQ(director.CompleteWave(), 500);
    EXPECT_EQ(director.GetState(), WaveState::Complete);
}

TEST(WaveDirectorTest, NextWaveStartsAfterTheDelay) {
    GameConfig config;
    Random random(3);
    WaveDirector director(config, random);
    director.StartWave(1);
    SpawnWholeWave(director, 100.0f);
    director.CompleteWave();

    EXPECT_FALSE(director.Tick(2999.0f, std::nullopt).waveStarted);
    WaveTickResult result = director.Tick(1.0f, std::nullopt);
    EXPECT_TRUE(result.waveStarted);
    EXPECT_EQ(director.GetCurrentWave(), 2);
    EXPECT_EQ(director.GetState(), WaveState::Spawning);
}

TEST(WaveDirectorTest, TracksRemainingEnemiesAndProgress) {
    GameConfig config;
    Random random(4);
    WaveDirector director(config, random);
    director.StartWave(1);
    EXPECT_EQ(director.GetEnemiesRemaining(), 4);
    EXPECT_FLOAT_EQ(director.GetWaveProgress(), 0.0f);

    director.OnEnemyDestroyed();
    EXPECT_EQ(director.GetEnemiesRemaining(), 3);
    EXPECT_FLOAT_EQ(director.GetWaveProgress(), 0.25f);
}

// ===== Spawn positions =====

TEST(WaveDirectorTest, SpawnPositionsSitOutsideTheWorldAwayFromThePlayer) {
    GameConfig config;
    Random random(5);
    WaveDirector director(config, random);
    glm::vec2 player(400.0f, 40.0f);

    for (int i = 0; i < 100; ++i) {
        glm::vec2 position = director.ChooseSpawnPosition(player);
        bool onEdge = position.x == -50.0f || position.x == 850.0f || position.y == -50.0f || position.y == 650.0f;
        EXPECT_TRUE(onEdge);
        if (position != director.GetFallbackSpawnPosition()) {
            EXPECT_GE(Vec2::Distance(position, player), 150.0f);
        }
    }
}

TEST(WaveDirectorTest, FallsBackToTopCenterAfterTwentyAttempts) {
    GameConfig config;
    config.minSpawnDistance = 100000.0f;
    Random random(6);
    WaveDirector director(config, random);

    glm::vec2 position = director.ChooseSpawnPosition(glm::vec2(400.0f, 300.0f));
    EXPECT_FLOAT_EQ(position.x, 400.0f);
    EXPECT_FLOAT_EQ(position.y, -50.0f);
}

// ===== Boss waves =====

TEST(WaveDirectorTest, EveryFifthWaveIsABossWave) {
    GameConfig config;
    Random random(7);
    WaveDirector director(config, random);
    EXPECT_FALSE(director.IsBossWave(4));
    EXPECT_TRUE(director.IsBossWave(5));
    EXPECT_TRUE(director.IsBossWave(10));
    EXPECT_FALSE(director.IsBossWave(0));
}

TEST(WaveDirectorTest, BossWaveRunsIntroThenWaitsForTheBoss) {
    GameConfig config;
    Random random(8);
    WaveDirector director(config, random);
    director.StartWave(5);
    EXPECT_EQ(director.GetState(), WaveState::BossIntro);

    WaveTickResult intro = director.Tick(0.0f, std::nullopt);
    EXPECT_TRUE(intro.waveStarted);
    EXPECT_TRUE(intro.bossIntroStarted);
    EXPECT_FALSE(intro.spawnBoss);

    EXPECT_FALSE(director.Tick(2999.0f, std::nullopt).spawnBoss);
    WaveTickResult spawn = director.Tick(1.0f, std::nullopt);
    EXPECT_TRUE(spawn.spawnBoss);
    EXPECT_TRUE(spawn.enemiesToSpawn.empty());
    EXPECT_TRUE(director.IsBossAlive());

    // An empty field is not enough while the boss lives
    EXPECT_FALSE(director.IsWaveComplete(0));

    director.OnBossDefeated();
    EXPECT_FALSE(director.IsBossAlive());
    EXPECT_TRUE(director.IsWaveComplete(0));
    EXPECT_EQ(director.CompleteWave(), 2500);
}

TEST(WaveDirectorTest, ResetReturnsToIdle) {
    GameConfig config;
    Random random(9);
    WaveDirector director(config, random);
    director.StartWave(3);
    director.Reset();
    EXPECT_EQ(director.GetState(), WaveState::Idle);
    EXPECT_EQ(director.GetCurrentWave(), 0);
    EXPECT_FALSE(director.Tick(100.0f, std::nullopt).waveStarted);
}
