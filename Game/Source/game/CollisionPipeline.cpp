#include "CollisionPipeline.hpp"
#include "ecs/Collisions/CircleCollider2D.hpp"
#include "Isolation.hpp"
#include "Spawners.hpp"
#include "Math/Vector2.hpp"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <stdexcept>

namespace {

constexpr int MISSILE_SCORE_FACTOR = 2;
constexpr int MISSILE_DAMAGE = 2;
constexpr int BOSS_SCORE_PER_TIER = 5000;
constexpr float BOSS_FREEZE_MS = 200.0f;
constexpr float BOSS_FREEZE_SCALE = 0.05f;
constexpr float SLOW_MOTION_SCALE = 0.5f;

// High combos land with a short freeze frame
constexpr int FREEZE_COMBO_START = 20;
constexpr float COMBO_FREEZE_SCALE = 0.1f;

template<typename T>
std::vector<Entity> Snapshot(EntityManager& entityManager) {
    auto query = entityManager.CreateQuery<T>();
    return query.Entities();
}

glm::vec2 PositionOf(const EntityManager& entityManager, Entity entity) {
    const Transform* transform = entityManager.GetComponent<Transform>(entity);
    if (!transform) {
        throw std::runtime_error("entity has no transform");
    }
    return transform->getPosition();
}

template<typename T>
T& Require(EntityManager& entityManager, Entity entity, const char* what) {
    T* component = entityManager.GetComponent<T>(entity);
    if (!component) {
        throw std::runtime_error(std::string("entity is not a ") + what);
    }
    return *component;
}

bool IsPositionClear(EntityManager& entityManager, const glm::vec2& position, float clearance) {
    auto asteroids = entityManager.CreateQuery<Transform, CircleCollider2D, AsteroidComponent>();
    for (auto [entity, transform, collider, rock] : asteroids) {
        if (Vec2::Distance(position, transform->getPosition()) < clearance + collider->radius) {
            return false;
        }
    }
    auto enemies = entityManager.CreateQuery<Transform, CircleCollider2D, EnemyComponent>();
    for (auto [entity, transform, collider, enemy] : enemies) {
        if (Vec2::Distance(position, transform->getPosition()) < clearance + collider->radius) {
            return false;
        }
    }
    return true;
}

}

int ScoreValue(const GameContext& ctx, float baseScore) {
    return ctx.difficulty.GetScoreValue(baseScore * ctx.combo.GetComboMultiplier());
}

int CreditKill(GameContext& ctx, std::vector<EventEntry>& events, float baseScore) {
    int points = ScoreValue(ctx, baseScore);
    ctx.AddScore(events, points);

    if (std::optional<Achievement> achievement = ctx.combo.OnKill(ctx.nowMs)) {
        ctx.UnlockAchievement(events, *achievement);
    }

    int combo = ctx.combo.GetComboCount();
    if (combo >= FREEZE_COMBO_START && combo % 5 == 0) {
        ctx.timeScale.Freeze(std::min(50.0f + combo * 2.0f, 150.0f), COMBO_FREEZE_SCALE);
    }
    return points;
}

void DestroyAsteroid(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events,
                     Entity asteroid, int scoreFactor, bool allowDrop) {
    const AsteroidComponent& rock = Require<AsteroidComponent>(entityManager, asteroid, "asteroid");
    glm::vec2 position = PositionOf(entityManager, asteroid);

    CreditKill(ctx, events, static_cast<float>(rock.GetScore() * scoreFactor));
    SplitAsteroid(entityManager, ctx.difficulty, ctx.random, asteroid);
    entityManager.DestroyEntity(asteroid);

    if (allowDrop && ctx.difficulty.ShouldSpawnPowerUp(ctx.config.asteroidDropChance, ctx.random.Next())) {
        CreatePowerUp(entityManager, ctx.random, RandomClassicPowerUp(ctx.random), position);
    }
}

void KillEnemy(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events,
               Entity enemy, int scoreFactor) {
    const EnemyComponent& ai = Require<EnemyComponent>(entityManager, enemy, "enemy");

    CreditKill(ctx, events, static_cast<float>(ai.GetScore() * scoreFactor));
    ctx.director.OnEnemyDestroyed();
    entityManager.DestroyEntity(enemy);
}

bool HitShip(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events) {
    Entity ship = ctx.GetShip(entityManager);
    if (ship == NULL_ENTITY) {
        return false;
    }
    const ShipComponent& hull = Require<ShipComponent>(entityManager, ship, "ship");
    if (!hull.CanTakeDamage()) {
        return false;
    }

    Entity shieldEntity = ctx.GetShield(entityManager);
    if (ShieldComponent* shield = shieldEntity != NULL_ENTITY
            ? entityManager.GetComponent<ShieldComponent>(shieldEntity) : nullptr) {
        if (shield->TakeDamage()) {
            Debug::Info("Collision") << "Shield depleted\n";
            entityManager.DestroyEntity(shieldEntity);
            ctx.shieldHandle = EntityHandle{};
        }
        return true;
    }

    DestroyShip(entityManager, ctx, events);
    return true;
}

void DestroyShip(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events) {
    Entity ship = ctx.GetShip(entityManager);
    glm::vec2 position(ctx.config.worldWidth / 2.0f, ctx.config.worldHeight / 2.0f);
    if (ship != NULL_ENTITY) {
        if (const Transform* transform = entityManager.GetComponent<Transform>(ship)) {
            position = transform->getPosition();
        }
        entityManager.DestroyEntity(ship);
    }

    Entity shield = ctx.GetShield(entityManager);
    if (shield != NULL_ENTITY) {
        entityManager.DestroyEntity(shield);
    }
    ctx.shipHandle = EntityHandle{};
    ctx.shieldHandle = EntityHandle{};

    if (!ctx.infiniteLives && ctx.lives > 0) {
        ctx.lives--;
    }
    ctx.Emit(events, LIFE_LOST, LifeLostEventData{ ctx.lives, position.x, position.y });
    ctx.combo.ResetStreaks();

    if (ctx.lives > 0 || ctx.infiniteLives) {
        ctx.respawning = true;
        ctx.respawnTimerMs = 0.0f;
    }

    Debug::Info("Collision") << "Ship destroyed, " << ctx.lives << " lives left\n";
}

void DetonateNuke(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events) {
    int destroyed = 0;
    auto asteroids = entityManager.CreateQuery<AsteroidComponent>();
    for (auto [entity, rock] : asteroids) {
        if (!entityManager.IsActive(entity)) {
            continue;
        }
        ctx.AddScore(events, ScoreValue(ctx, static_cast<float>(rock->GetScore())));
        entityManager.DestroyEntity(entity);
        destroyed++;
    }
    Debug::Info("Collision") << "Nuke cleared " << destroyed << " asteroids\n";
}

void PerformHyperspace(EntityManager& entityManager, GameContext& ctx, Entity ship) {
    Transform* transform = entityManager.GetComponent<Transform>(ship);
    if (!transform) {
        return;
    }

    glm::vec2 destination(0.0f);
    for (int attempt = 0; attempt < CollisionResolutionSystem::HYPERSPACE_ATTEMPTS; ++attempt) {
        destination = glm::vec2(ctx.random.Range(0.0f, ctx.config.worldWidth),
                                ctx.random.Range(0.0f, ctx.config.worldHeight));
        if (IsPositionClear(entityManager, destination, CollisionResolutionSystem::HYPERSPACE_CLEARANCE)) {
            break;
        }
    }
    transform->setPosition(destination);
}

void ApplyPowerUp(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events,
                  PowerUpType type, const glm::vec2& position) {
    const PowerUpConfig* config = FindPowerUpConfig(type);
    if (!config) {
        return;
    }
    Entity ship = ctx.GetShip(entityManager);

    if (config->route == PowerUpRoute::Ledger) {
        ctx.weapons.AddPowerUp(type, config->durationMs);
    } else {
        switch (type) {
        case PowerUpType::Shield:
            if (ctx.GetShield(entityManager) == NULL_ENTITY) {
                float duration = ctx.difficulty.GetShieldDuration(ShieldComponent::PICKUP_DURATION_MS);
                ctx.shieldHandle = entityManager.GetHandle(CreateShield(entityManager, ship, duration));
            }
            break;
        case PowerUpType::Hyperspace:
            PerformHyperspace(entityManager, ctx, ship);
            break;
        case PowerUpType::SlowMotion:
            ctx.timeScale.SetScale(SLOW_MOTION_SCALE, config->durationMs);
            break;
        case PowerUpType::Nuke:
            DetonateNuke(entityManager, ctx, events);
            break;
        case PowerUpType::Invincibility:
            if (ShipComponent* hull = entityManager.GetComponent<ShipComponent>(ship)) {
                hull->MakeInvulnerable(config->durationMs);
            }
            break;
        default:
            ReportConfigurationError(std::string(config->name) + " has no special handler");
            return;
        }
    }

    Debug::Info("Collision") << "Collected " << config->name << "\n";
    ctx.Emit(events, POWERUP_COLLECTED, PowerUpCollectedEventData{ static_cast<int>(type), position.x, position.y });

    if (std::optional<Achievement> achievement = ctx.combo.OnPowerUpCollected()) {
        ctx.UnlockAchievement(events, *achievement);
    }
}

void DefeatBoss(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events, Entity boss) {
    const BossComponent& state = Require<BossComponent>(entityManager, boss, "boss");
    const BossType type = state.type;
    const glm::vec2 position = PositionOf(entityManager, boss);
    const int wave = ctx.director.GetCurrentWave();

    int bossScore = BOSS_SCORE_PER_TIER * (wave / 5);
    ctx.AddScore(events, bossScore);
    ctx.UnlockAchievement(events, ctx.combo.OnBossKilled());
    ctx.timeScale.Freeze(BOSS_FREEZE_MS, BOSS_FREEZE_SCALE);

    int rewards = 2 + wave / 10;
    for (int i = 0; i < rewards; ++i) {
        float angle = (static_cast<float>(i) / rewards) * glm::two_pi<float>();
        glm::vec2 spot = position + Vec2::FromAngle(angle, CollisionResolutionSystem::BOSS_REWARD_RADIUS);
        CreatePowerUp(entityManager, ctx.random, RandomClassicPowerUp(ctx.random), spot);
    }

    auto projectiles = entityManager.CreateQuery<BossProjectileComponent>();
    for (auto [entity, projectile] : projectiles) {
        entityManager.DestroyEntity(entity);
    }

    entityManager.DestroyEntity(boss);
    ctx.bossHandle = EntityHandle{};
    ctx.director.OnBossDefeated();

    Debug::Info("Collision") << BossName(type) << " defeated on wave " << wave << "\n";
    ctx.Emit(events, BOSS_DEFEATED, BossEventData{ wave, static_cast<int>(type), bossScore, position.x, position.y });
}

void CollisionResolutionSystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    const std::vector<Entity> asteroids = Snapshot<AsteroidComponent>(entityManager);
    const std::vector<Entity> bullets = Snapshot<BulletComponent>(entityManager);
    const std::vector<Entity> enemies = Snapshot<EnemyComponent>(entityManager);
    const std::vector<Entity> powerUps = Snapshot<PowerUpComponent>(entityManager);
    const std::vector<Entity> projectiles = Snapshot<BossProjectileComponent>(entityManager);
    const std::vector<Entity> missiles = Snapshot<HomingMissileComponent>(entityManager);

    ShipVsHazards(entityManager, events, asteroids);
    BulletsVsAsteroids(entityManager, events, bullets, asteroids);
    ShipVsPowerUps(entityManager, events, powerUps);
    ShipVsHazards(entityManager, events, enemies);
    BulletsVsEnemies(entityManager, events, bullets, enemies);
    BulletsVsBoss(entityManager, events, bullets);
    ShipVsBoss(entityManager, events);
    ProjectilesVsShip(entityManager, events, projectiles);
    MissilesVsAsteroids(entityManager, events, missiles, asteroids);
    MissilesVsEnemies(entityManager, events, missiles, enemies);
}

void CollisionResolutionSystem::ShipVsHazards(EntityManager& entityManager, std::vector<EventEntry>& events,
                                              const std::vector<Entity>& hazards) {
    for (auto it = hazards.rbegin(); it != hazards.rend(); ++it) {
        Entity ship = ctx.GetShip(entityManager);
        if (ship == NULL_ENTITY) {
            return;
        }
        Entity hazard = *it;
        if (!CheckOverlap(entityManager, ship, hazard)) {
            continue;
        }
        RunIsolated(entityManager, hazard, "Collision", [&]() {
            HitShip(entityManager, ctx, events);
        });
    }
}

void CollisionResolutionSystem::BulletsVsAsteroids(EntityManager& entityManager, std::vector<EventEntry>& events,
                                                   const std::vector<Entity>& bullets, const std::vector<Entity>& asteroids) {
    for (auto bulletIt = bullets.rbegin(); bulletIt != bullets.rend(); ++bulletIt) {
        Entity bulletEntity = *bulletIt;
        if (!entityManager.IsActive(bulletEntity)) {
            continue;
        }

        RunIsolated(entityManager, bulletEntity, "Collision", [&]() {
            BulletComponent& bullet = Require<BulletComponent>(entityManager, bulletEntity, "bullet");

            for (auto rockIt = asteroids.rbegin(); rockIt != asteroids.rend(); ++rockIt) {
                Entity asteroid = *rockIt;
                EntityHandle target = entityManager.GetHandle(asteroid);
                if (bullet.HasPierced(target) || !CheckOverlap(entityManager, bulletEntity, asteroid)) {
                    continue;
                }

                bullet.MarkPierced(target);
                DestroyAsteroid(entityManager, ctx, events, asteroid, 1, true);

                if (!bullet.piercing) {
                    entityManager.DestroyEntity(bulletEntity);
                    break;
                }
            }
        });
    }
}

void CollisionResolutionSystem::ShipVsPowerUps(EntityManager& entityManager, std::vector<EventEntry>& events,
                                               const std::vector<Entity>& powerUps) {
    for (auto it = powerUps.rbegin(); it != powerUps.rend(); ++it) {
        Entity ship = ctx.GetShip(entityManager);
        if (ship == NULL_ENTITY) {
            return;
        }
        Entity pickup = *it;
        if (!CheckOverlap(entityManager, ship, pickup)) {
            continue;
        }

        RunIsolated(entityManager, pickup, "Collision", [&]() {
            PowerUpType type = Require<PowerUpComponent>(entityManager, pickup, "power-up").type;
            glm::vec2 position = PositionOf(entityManager, pickup);
            entityManager.DestroyEntity(pickup);
            ApplyPowerUp(entityManager, ctx, events, type, position);
        });
    }
}

void CollisionResolutionSystem::BulletsVsEnemies(EntityManager& entityManager, std::vector<EventEntry>& events,
                                                 const std::vector<Entity>& bullets, const std::vector<Entity>& enemies) {
    for (auto bulletIt = bullets.rbegin(); bulletIt != bullets.rend(); ++bulletIt) {
        Entity bulletEntity = *bulletIt;
        if (!entityManager.IsActive(bulletEntity)) {
            continue;
        }

        RunIsolated(entityManager, bulletEntity, "Collision", [&]() {
            BulletComponent& bullet = Require<BulletComponent>(entityManager, bulletEntity, "bullet");

            for (auto enemyIt = enemies.rbegin(); enemyIt != enemies.rend(); ++enemyIt) {
                Entity enemyEntity = *enemyIt;
                EntityHandle target = entityManager.GetHandle(enemyEntity);
                if (bullet.HasPierced(target) || !CheckOverlap(entityManager, bulletEntity, enemyEntity)) {
                    continue;
                }

                bullet.MarkPierced(target);
                EnemyComponent& enemy = Require<EnemyComponent>(entityManager, enemyEntity, "enemy");
                if (enemy.TakeDamage(std::max(1, static_cast<int>(bullet.damage)))) {
                    KillEnemy(entityManager, ctx, events, enemyEntity, 1);
                }

                if (!bullet.piercing) {
                    entityManager.DestroyEntity(bulletEntity);
                    break;
                }
            }
        });
    }
}

void CollisionResolutionSystem::BulletsVsBoss(EntityManager& entityManager, std::vector<EventEntry>& events,
                                              const std::vector<Entity>& bullets) {
    for (auto bulletIt = bullets.rbegin(); bulletIt != bullets.rend(); ++bulletIt) {
        Entity boss = ctx.GetBoss(entityManager);
        if (boss == NULL_ENTITY) {
            return;
        }
        Entity bulletEntity = *bulletIt;
        if (!entityManager.IsActive(bulletEntity)) {
            continue;
        }

        RunIsolated(entityManager, bulletEntity, "Collision", [&]() {
            BulletComponent& bullet = Require<BulletComponent>(entityManager, bulletEntity, "bullet");
            EntityHandle target = entityManager.GetHandle(boss);
            if (bullet.HasPierced(target) || !CheckOverlap(entityManager, bulletEntity, boss)) {
                return;
            }

            bullet.MarkPierced(target);
            bool defeated = Require<BossComponent>(entityManager, boss, "boss").TakeDamage(BossComponent::BULLET_DAMAGE);
            if (!bullet.piercing) {
                entityManager.DestroyEntity(bulletEntity);
            }
            if (defeated) {
                DefeatBoss(entityManager, ctx, events, boss);
            }
        });
    }
}

void CollisionResolutionSystem::ShipVsBoss(EntityManager& entityManager, std::vector<EventEntry>& events) {
    Entity ship = ctx.GetShip(entityManager);
    Entity boss = ctx.GetBoss(entityManager);
    if (ship == NULL_ENTITY || boss == NULL_ENTITY || !CheckOverlap(entityManager, ship, boss)) {
        return;
    }
    RunIsolated(entityManager, boss, "Collision", [&]() {
        HitShip(entityManager, ctx, events);
    });
}

void CollisionResolutionSystem::ProjectilesVsShip(EntityManager& entityManager, std::vector<EventEntry>& events,
                                                  const std::vector<Entity>& projectiles) {
    for (auto it = projectiles.rbegin(); it != projectiles.rend(); ++it) {
        Entity ship = ctx.GetShip(entityManager);
        if (ship == NULL_ENTITY) {
            return;
        }
        Entity projectile = *it;
        if (!CheckOverlap(entityManager, projectile, ship)) {
            continue;
        }

        RunIsolated(entityManager, projectile, "Collision", [&]() {
            if (HitShip(entityManager, ctx, events)) {
                entityManager.DestroyEntity(projectile);
            }
        });
    }
}

void CollisionResolutionSystem::MissilesVsAsteroids(EntityManager& entityManager, std::vector<EventEntry>& events,
                                                    const std::vector<Entity>& missiles, const std::vector<Entity>& asteroids) {
    for (auto missileIt = missiles.rbegin(); missileIt != missiles.rend(); ++missileIt) {
        Entity missile = *missileIt;
        if (!entityManager.IsActive(missile)) {
            continue;
        }

        RunIsolated(entityManager, missile, "Collision", [&]() {
            for (auto rockIt = asteroids.rbegin(); rockIt != asteroids.rend(); ++rockIt) {
                Entity asteroid = *rockIt;
                if (!CheckOverlap(entityManager, missile, asteroid)) {
                    continue;
                }
                DestroyAsteroid(entityManager, ctx, events, asteroid, MISSILE_SCORE_FACTOR, false);
                entityManager.DestroyEntity(missile);
                break;
            }
        });
    }
}

void CollisionResolutionSystem::MissilesVsEnemies(EntityManager& entityManager, std::vector<EventEntry>& events,
                                                  const std::vector<Entity>& missiles, const std::vector<Entity>& enemies) {
    for (auto missileIt = missiles.rbegin(); missileIt != missiles.rend(); ++missileIt) {
        Entity missile = *missileIt;
        if (!entityManager.IsActive(missile)) {
            continue;
        }

        RunIsolated(entityManager, missile, "Collision", [&]() {
            for (auto enemyIt = enemies.rbegin(); enemyIt != enemies.rend(); ++enemyIt) {
                Entity enemyEntity = *enemyIt;
                if (!CheckOverlap(entityManager, missile, enemyEntity)) {
                    continue;
                }
                EnemyComponent& enemy = Require<EnemyComponent>(entityManager, enemyEntity, "enemy");
                if (enemy.TakeDamage(MISSILE_DAMAGE)) {
                    KillEnemy(entityManager, ctx, events, enemyEntity, MISSILE_SCORE_FACTOR);
                }
                entityManager.DestroyEntity(missile);
                break;
            }
        });
    }
}
