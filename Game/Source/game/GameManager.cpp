#include "GameManager.hpp"
#include "CollisionPipeline.hpp"
#include "LogicSystems.hpp"
#include "Spawners.hpp"
#include "Math/Vector2.hpp"
#include "Utils/Debug/Debug.hpp"

#include <algorithm>
#include <cmath>
#include <memory>

GameManager::GameManager(const GameConfig& config, Random& random)
    : config(config)
    , random(random)
    , difficulty(config.difficulty)
    , director(this->config, random)
    , ctx(this->config, difficulty, random, weapons, director, combo, timeScale)
    , state(GameState::GameOver)
    , recorder(nullptr)
{
}

void GameManager::RegisterSystems() {
    world.AddSystem(std::make_unique<ShipSystem>(ctx));
    world.AddSystem(std::make_unique<WeaponTimerSystem>(ctx));
    world.AddSystem(std::make_unique<WaveSpawnSystem>(ctx));
    world.AddSystem(std::make_unique<BossSystem>(ctx));
    world.AddSystem(std::make_unique<BossProjectileSystem>(ctx));
    world.AddSystem(std::make_unique<EnemySystem>(ctx));
    world.AddSystem(std::make_unique<HomingMissileSystem>(ctx));
    world.AddSystem(std::make_unique<ShieldSystem>(ctx));
    world.AddSystem(std::make_unique<AsteroidSystem>(ctx));
    world.AddSystem(std::make_unique<BulletSystem>(ctx));
    world.AddSystem(std::make_unique<PowerUpSystem>(ctx));
    world.AddSystem(std::make_unique<PowerUpSpawnSystem>(ctx));
    world.AddSystem(std::make_unique<CollisionResolutionSystem>(ctx));
    world.AddSystem(std::make_unique<ShieldExpirySystem>(ctx));
    world.AddSystem(std::make_unique<DestroyingSystem>());
}

void GameManager::StartNewGame() {
    Debug::Info("GameManager") << "New game, difficulty " << DifficultyManager::LevelName(difficulty.GetLevel())
                               << ", seed " << random.GetSeed() << "\n";

    world.Clear();
    RegisterGameComponents(world.GetEntityManager());
    RegisterSystems();

    weapons.Reset();
    director.Reset();
    combo = ComboTracker();
    timeScale.Reset();
    ctx.ResetSession();
    drained.clear();
    state = GameState::Playing;

    SpawnShip();
    SpawnAsteroidField();
    director.StartWave(1);
}

void GameManager::SpawnShip() {
    EntityManager& em = world.GetEntityManager();
    glm::vec2 center(config.worldWidth / 2.0f, config.worldHeight / 2.0f);
    ctx.shipHandle = em.GetHandle(CreateShip(em, center));
    ctx.respawning = false;
    ctx.respawnTimerMs = 0.0f;
}

void GameManager::SpawnAsteroidField() {
    const DifficultySettings& settings = difficulty.GetSettings();
    int count = std::min(static_cast<int>(std::round((4 + ctx.level) * settings.asteroidSpawnRate)),
                         settings.maxAsteroidsOnScreen);

    glm::vec2 safeZone(config.worldWidth / 2.0f, config.worldHeight / 2.0f);
    for (int i = 0; i < count; ++i) {
        CreateRandomAsteroid(world.GetEntityManager(), config, difficulty, random, safeZone);
    }
    Debug::Info("GameManager") << "Level " << ctx.level << " field: " << count << " asteroids\n";
}

bool GameManager::CanRespawnSafely() {
    glm::vec2 center(config.worldWidth / 2.0f, config.worldHeight / 2.0f);
    auto asteroids = world.GetEntityManager().CreateQuery<Transform, AsteroidComponent>();
    for (auto [entity, transform, rock] : asteroids) {
        if (Vec2::Distance(center, transform->getPosition()) < config.respawnSafeRadius) {
            return false;
        }
    }
    return true;
}

void GameManager::UpdateRespawn(float deltaMs) {
    if (!ctx.respawning) {
        return;
    }
    ctx.respawnTimerMs += deltaMs;
    if (ctx.respawnTimerMs < config.respawnDelayMs) {
        return;
    }

    if (CanRespawnSafely()) {
        SpawnShip();
        Debug::Info("GameManager") << "Ship respawned\n";
    } else {
        ctx.respawnTimerMs = config.respawnRetryMs;
    }
}

void GameManager::HandleInput(const Input& input, std::vector<EventEntry>& events) {
    ctx.controls.thrust = input.KeyPressed(KeyCode(GameKey::Thrust));
    ctx.controls.turnLeft = input.KeyPressed(KeyCode(GameKey::TurnLeft));
    ctx.controls.turnRight = input.KeyPressed(KeyCode(GameKey::TurnRight));
    ctx.controls.fire = input.KeyPressed(KeyCode(GameKey::Fire));
    ctx.controls.missile = input.KeyTapped(KeyCode(GameKey::Missile));

    EntityManager& em = world.GetEntityManager();
    if (input.KeyTapped(KeyCode(GameKey::Shield))) {
        Entity ship = ctx.GetShip(em);
        if (ship != NULL_ENTITY && ctx.GetShield(em) == NULL_ENTITY) {
            ctx.shieldHandle = em.GetHandle(CreateShield(em, ship, ShieldComponent::MANUAL_DURATION_MS));
        }
    }

    if (input.KeyTapped(KeyCode(GameKey::InfiniteLives))) {
        ctx.infiniteLives = !ctx.infiniteLives;
        Debug::Info("GameManager") << "Infinite lives " << (ctx.infiniteLives ? "on" : "off") << "\n";
    }
}

void GameManager::Update(float deltaMs, const Input& input) {
    if (state != GameState::Playing) {
        return;
    }

    const float clamped = std::clamp(deltaMs, 0.0f, config.maxDeltaMs);
    timeScale.Update(clamped);
    const float scaled = timeScale.Apply(clamped);

    ctx.tick++;
    ctx.nowMs += scaled;
    combo.Tick(scaled, ctx.nowMs);

    std::vector<EventEntry>& events = world.GetEvents();
    UpdateRespawn(scaled);
    HandleInput(input, events);

    world.Update(scaled / 1000.0f);

    // A ship lost to a failing update still costs a life
    EntityManager& em = world.GetEntityManager();
    if (!ctx.shipHandle.IsNull() && ctx.GetShip(em) == NULL_ENTITY) {
        DestroyShip(em, ctx, events);
        em.FlushDestroyedEntities();
    }

    CheckWaveCompletion(events);
    CheckLevelCompletion(events);

    if (ctx.GetShip(em) == NULL_ENTITY && !ctx.respawning && !ctx.infiniteLives && ctx.lives <= 0) {
        EnterGameOver(events);
    }

    drained.insert(drained.end(), events.begin(), events.end());
    world.ClearEvents();
}

void GameManager::CheckWaveCompletion(std::vector<EventEntry>& events) {
    auto enemies = world.GetEntityManager().CreateQuery<EnemyComponent>();
    if (!director.IsWaveComplete(enemies.Count())) {
        return;
    }

    const int wave = director.GetCurrentWave();
    const int bonus = director.CompleteWave();
    ctx.AddScore(events, bonus);
    ctx.Emit(events, WAVE_CLEARED, WaveEventData{ wave, bonus, 0 });
    ctx.UnlockAchievement(events, combo.OnWaveCleared(wave));
}

void GameManager::CheckLevelCompletion(std::vector<EventEntry>& events) {
    auto asteroids = world.GetEntityManager().CreateQuery<AsteroidComponent>();
    if (asteroids.Count() > 0) {
        return;
    }

    ctx.level++;
    const int bonus = config.levelBonusPerLevel * ctx.level;
    ctx.Emit(events, LEVEL_CLEARED, LevelClearedEventData{ ctx.level, bonus });
    ctx.AddScore(events, bonus);
    SpawnAsteroidField();
}

void GameManager::EnterGameOver(std::vector<EventEntry>& events) {
    state = GameState::GameOver;
    const int wave = director.GetCurrentWave();
    Debug::Info("GameManager") << "Game over with " << ctx.score << " points on wave " << wave << "\n";

    ctx.Emit(events, GAME_OVER, GameOverEventData{ ctx.score, wave, ctx.level });
    if (recorder) {
        recorder->RecordFinalScore(ctx.score, wave);
    }
}

std::vector<EventEntry> GameManager::DrainEvents() {
    std::vector<EventEntry> result;
    result.swap(drained);
    return result;
}

GameSnapshot GameManager::GetSnapshot() {
    EntityManager& em = world.GetEntityManager();

    GameSnapshot snapshot;
    snapshot.state = state;
    snapshot.score = ctx.score;
    snapshot.lives = ctx.lives;
    snapshot.level = ctx.level;
    snapshot.wave = director.GetCurrentWave();
    snapshot.waveState = director.GetState();
    snapshot.enemiesRemaining = director.GetEnemiesRemaining();
    snapshot.waveProgress = director.GetWaveProgress();
    snapshot.shipAlive = ctx.GetShip(em) != NULL_ENTITY;
    snapshot.shieldActive = ctx.GetShield(em) != NULL_ENTITY;

    Entity boss = ctx.GetBoss(em);
    const BossComponent* bossState = boss != NULL_ENTITY ? em.GetComponent<BossComponent>(boss) : nullptr;
    snapshot.bossAlive = bossState != nullptr;
    snapshot.bossHealthRatio = bossState ? bossState->GetHealthRatio() : 0.0f;

    snapshot.comboCount = combo.GetComboCount();
    snapshot.comboMultiplier = combo.GetComboMultiplier();
    snapshot.timeScale = timeScale.GetScale();
    snapshot.homingMissileCharges = weapons.GetHomingMissileCharges();
    snapshot.asteroidCount = em.CreateQuery<AsteroidComponent>().Count();
    snapshot.enemyCount = em.CreateQuery<EnemyComponent>().Count();
    snapshot.bulletCount = em.CreateQuery<BulletComponent>().Count();
    snapshot.powerUpCount = em.CreateQuery<PowerUpComponent>().Count();
    snapshot.activeEffects = weapons.GetActiveEffects();

    auto bodies = em.CreateQuery<Transform, CircleCollider2D>();
    snapshot.entities.reserve(bodies.Count());
    bodies.ForEach([&](Entity entity, Transform* transform, CircleCollider2D* collider) {
        EntityView view{ entity, collider->layer, transform->getPosition(), transform->getRotation(),
                         collider->radius, 0, {} };

        if (const AsteroidComponent* asteroid = em.GetComponent<AsteroidComponent>(entity)) {
            view.variant = static_cast<int>(asteroid->size);
            view.outline = asteroid->outline;
        } else if (const EnemyComponent* enemy = em.GetComponent<EnemyComponent>(entity)) {
            view.variant = static_cast<int>(enemy->type);
        } else if (const BossComponent* bossBody = em.GetComponent<BossComponent>(entity)) {
            view.variant = bossBody->GetPhase();
        } else if (const PowerUpComponent* powerUp = em.GetComponent<PowerUpComponent>(entity)) {
            view.variant = static_cast<int>(powerUp->type);
        }
        snapshot.entities.push_back(std::move(view));
    });
    return snapshot;
}
