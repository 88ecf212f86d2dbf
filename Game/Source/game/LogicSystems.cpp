#include "LogicSystems.hpp"
#include "Isolation.hpp"
#include "Spawners.hpp"
#include "ecs/Collisions/CollisionHelpers.hpp"
#include "Math/Vector2.hpp"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <optional>
#include <stdexcept>

namespace {

// Moves the entity by its velocity and applies its boundary policy.
// Returns false when the entity left the world and was culled.
bool Integrate(EntityManager& entityManager, Entity entity, Transform& transform,
               const Kinematics& kinematics, float deltaTime, const GameConfig& config) {
    transform.translate(kinematics.velocity * deltaTime);

    const CircleCollider2D* collider = entityManager.GetComponent<CircleCollider2D>(entity);
    float radius = collider ? collider->radius : 0.0f;

    switch (kinematics.wrapMode) {
    case WrapMode::Wrap:
        transform.setPosition(CollisionHelpers::WrapPosition(transform.getPosition(), radius,
                                                             config.worldWidth, config.worldHeight));
        break;
    case WrapMode::Clamp:
        transform.setPosition(CollisionHelpers::ClampPosition(transform.getPosition(), radius,
                                                              config.worldWidth, config.worldHeight));
        break;
    case WrapMode::Cull:
        if (CollisionHelpers::IsOutsideBounds(transform.getPosition(), radius,
                                              config.worldWidth, config.worldHeight)) {
            entityManager.DestroyEntity(entity);
            return false;
        }
        break;
    case WrapMode::None:
        break;
    }
    return true;
}

// Turns the transform toward the angle by at most maxTurn radians
void SteerToward(Transform& transform, float targetAngle, float maxTurn) {
    float diff = Vec2::WrapAngle(targetAngle - transform.getRotation());
    if (std::fabs(diff) < maxTurn) {
        transform.setRotation(targetAngle);
    } else {
        transform.rotate(diff > 0.0f ? maxTurn : -maxTurn);
    }
}

std::optional<glm::vec2> ShipPosition(const EntityManager& entityManager, const GameContext& ctx) {
    Entity ship = ctx.GetShip(entityManager);
    if (ship == NULL_ENTITY) {
        return std::nullopt;
    }
    const Transform* transform = entityManager.GetComponent<Transform>(ship);
    if (!transform) {
        return std::nullopt;
    }
    return transform->getPosition();
}

template<typename Tag>
void ConsiderTargets(EntityManager& entityManager, const glm::vec2& from, EntityHandle& best, float& bestDistance) {
    auto query = entityManager.CreateQuery<Transform, Tag>();
    for (auto [entity, transform, tag] : query) {
        float distance = Vec2::DistanceSquared(from, transform->getPosition());
        if (distance < bestDistance) {
            bestDistance = distance;
            best = entityManager.GetHandle(entity);
        }
    }
}

EntityHandle FindNearestMissileTarget(EntityManager& entityManager, const glm::vec2& from) {
    EntityHandle best;
    float bestDistance = std::numeric_limits<float>::max();
    ConsiderTargets<AsteroidComponent>(entityManager, from, best, bestDistance);
    ConsiderTargets<EnemyComponent>(entityManager, from, best, bestDistance);
    return best;
}

}

void ShipSystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    Entity entity = ctx.GetShip(entityManager);
    if (entity == NULL_ENTITY) {
        return;
    }
    const float deltaMs = deltaTime * 1000.0f;

    RunIsolated(entityManager, entity, "ShipSystem", [&]() {
        Transform* transform = entityManager.GetComponent<Transform>(entity);
        Kinematics* kinematics = entityManager.GetComponent<Kinematics>(entity);
        ShipComponent* ship = entityManager.GetComponent<ShipComponent>(entity);
        if (!transform || !kinematics || !ship) {
            throw std::runtime_error("ship is missing components");
        }

        float turn = 0.0f;
        if (ctx.controls.turnLeft) turn -= 1.0f;
        if (ctx.controls.turnRight) turn += 1.0f;
        ship->SetTurn(turn);
        ship->SetThrust(ctx.controls.thrust ? 1.0f : 0.0f);

        if (ship->invulnerableMs > 0.0f) {
            ship->invulnerableMs = std::max(0.0f, ship->invulnerableMs - deltaMs);
        }

        transform->rotate(ship->turn * ShipComponent::ROTATION_SPEED * deltaTime);

        if (ship->thrust > 0.0f) {
            kinematics->velocity += Vec2::FromAngle(transform->getRotation(), ShipComponent::THRUST_POWER * deltaTime);
        }
        kinematics->velocity = Vec2::Limit(kinematics->velocity * ShipComponent::FRICTION, ShipComponent::MAX_SPEED);

        Integrate(entityManager, entity, *transform, *kinematics, deltaTime, ctx.config);

        // Input is consumed by one update
        ship->thrust = 0.0f;
        ship->turn = 0.0f;

        float heading = transform->getRotation();
        glm::vec2 front = transform->getPosition() + Vec2::FromAngle(heading, ShipComponent::FRONT_OFFSET);

        if (ctx.controls.fire) {
            std::vector<BulletSpec> shots = ctx.weapons.Shoot(ctx.nowMs, front, heading);
            for (const BulletSpec& shot : shots) {
                CreateBullet(entityManager, shot);
            }
            if (!shots.empty()) {
                ShotFiredEventData data{};
                data.bulletCount = static_cast<int>(shots.size());
                std::strncpy(data.sound, ctx.weapons.GetFireSound(), sizeof(data.sound) - 1);
                ctx.Emit(events, SHOT_FIRED, data);
            }
        }

        if (ctx.controls.missile && ctx.weapons.LaunchHomingMissile()) {
            CreateHomingMissile(entityManager, front, heading);
        }
    });
}

void WeaponTimerSystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    ctx.weapons.Advance(deltaTime * 1000.0f);
}

void WaveSpawnSystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    // A boss removed without a kill must not hold the wave open
    if (ctx.director.IsBossAlive() && ctx.GetBoss(entityManager) == NULL_ENTITY) {
        Debug::Warning("WaveSpawnSystem") << "Boss of wave " << ctx.director.GetCurrentWave()
                                          << " is gone without a kill, releasing the wave\n";
        ctx.bossHandle = EntityHandle{};
        ctx.director.OnBossDefeated();
    }

    WaveTickResult result = ctx.director.Tick(deltaTime * 1000.0f, ShipPosition(entityManager, ctx));
    const int wave = ctx.director.GetCurrentWave();

    if (result.waveStarted) {
        ctx.Emit(events, WAVE_STARTED, WaveEventData{ wave, 0, ctx.director.GetTotalEnemies() });
    }

    if (result.bossIntroStarted) {
        // The boss gets the field to itself
        auto enemies = entityManager.CreateQuery<EnemyComponent>();
        for (auto [entity, enemy] : enemies) {
            entityManager.DestroyEntity(entity);
        }
        BossEventData data{ wave, static_cast<int>(BossTypeForWave(wave)), 0, 0.0f, 0.0f };
        ctx.Emit(events, BOSS_INTRO, data);
    }

    if (!ctx.director.IsBossAlive() || result.spawnBoss) {
        for (const EnemySpawnRequest& request : result.enemiesToSpawn) {
            CreateEnemy(entityManager, ctx.random, request.type, request.position,
                        ctx.difficulty.GetSettings().enemySpeedMultiplier);
        }
    }

    if (result.spawnBoss) {
        BossType type = BossTypeForWave(wave);
        glm::vec2 center(ctx.config.worldWidth / 2.0f, ctx.config.worldHeight / 2.0f);
        Entity boss = CreateBoss(entityManager, type, center);
        ctx.bossHandle = entityManager.GetHandle(boss);

        Debug::Info("GameManager") << BossName(type) << " spawned for wave " << wave << "\n";
        ctx.Emit(events, BOSS_SPAWNED, BossEventData{ wave, static_cast<int>(type), 0, center.x, center.y });
    }
}

void BossSystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    Entity entity = ctx.GetBoss(entityManager);
    if (entity == NULL_ENTITY) {
        return;
    }
    const float deltaMs = deltaTime * 1000.0f;

    RunIsolated(entityManager, entity, "BossSystem", [&]() {
        Transform* transform = entityManager.GetComponent<Transform>(entity);
        Kinematics* kinematics = entityManager.GetComponent<Kinematics>(entity);
        BossComponent* boss = entityManager.GetComponent<BossComponent>(entity);
        if (!transform || !kinematics || !boss) {
            throw std::runtime_error("boss is missing components");
        }

        const BossStats& stats = GetBossStats(boss->type);
        boss->attackTimerMs += deltaMs;
        boss->moveTimerMs += deltaMs;

        if (boss->moveTimerMs >= stats.retargetIntervalMs) {
            boss->moveTarget = boss->PickMoveTarget(ctx.config.worldWidth, ctx.config.worldHeight, ctx.random);
            boss->moveTimerMs = 0.0f;
        }

        glm::vec2 toTarget = boss->moveTarget - transform->getPosition();
        float distance = Vec2::Magnitude(toTarget);
        kinematics->velocity = distance > BossComponent::ARRIVE_DISTANCE
            ? toTarget * (stats.speed / distance)
            : glm::vec2(0.0f);

        Integrate(entityManager, entity, *transform, *kinematics, deltaTime, ctx.config);
        transform->rotate(deltaTime * glm::half_pi<float>());

        if (boss->CanAttack()) {
            for (const glm::vec2& direction : boss->GetAttackPattern(transform->getRotation(), ctx.random)) {
                CreateBossProjectile(entityManager, transform->getPosition(), direction);
            }
            boss->ResetAttackTimer();
        }
    });
}

void BossProjectileSystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    const float deltaMs = deltaTime * 1000.0f;

    auto query = entityManager.CreateQuery<Transform, Kinematics, BossProjectileComponent>();
    query.ForEach([&](Entity entity, Transform* transform, Kinematics* kinematics, BossProjectileComponent* projectile) {
        RunIsolated(entityManager, entity, "BossProjectileSystem", [&]() {
            projectile->ageMs += deltaMs;
            if (projectile->ageMs > BossProjectileComponent::LIFETIME_MS) {
                entityManager.DestroyEntity(entity);
                return;
            }
            Integrate(entityManager, entity, *transform, *kinematics, deltaTime, ctx.config);
        });
    });
}

void EnemySystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    const float deltaMs = deltaTime * 1000.0f;
    std::optional<glm::vec2> target = ShipPosition(entityManager, ctx);

    auto query = entityManager.CreateQuery<Transform, Kinematics, EnemyComponent>();
    query.ForEach([&](Entity entity, Transform* transform, Kinematics* kinematics, EnemyComponent* enemy) {
        if (!entityManager.IsActive(entity)) {
            return;
        }

        RunIsolated(entityManager, entity, "EnemySystem", [&]() {
            enemy->wanderTimeMs += deltaMs;

            if (!target) {
                if (enemy->wanderTimeMs > EnemyComponent::WANDER_INTERVAL_MS) {
                    enemy->wanderAngle += (ctx.random.Next() - 0.5f) * glm::pi<float>();
                    enemy->wanderTimeMs = 0.0f;
                }
                transform->setRotation(enemy->wanderAngle);
                kinematics->velocity = Vec2::FromAngle(enemy->wanderAngle, enemy->speed * 0.5f);
            } else {
                float targetAngle = Vec2::Angle(*target - transform->getPosition());
                float wanderInfluence = std::sin(enemy->wanderTimeMs * 0.003f) * 0.5f;
                SteerToward(*transform, targetAngle + wanderInfluence, EnemyComponent::TURN_SPEED * deltaTime);

                float speed = enemy->speed * GetEnemyStats(enemy->type).aggressiveness;
                kinematics->velocity = Vec2::FromAngle(transform->getRotation(), speed);
            }

            Integrate(entityManager, entity, *transform, *kinematics, deltaTime, ctx.config);
        });
    });
}

void HomingMissileSystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    const float deltaMs = deltaTime * 1000.0f;
    const float width = ctx.config.worldWidth;
    const float height = ctx.config.worldHeight;

    auto query = entityManager.CreateQuery<Transform, Kinematics, HomingMissileComponent>();
    query.ForEach([&](Entity entity, Transform* transform, Kinematics* kinematics, HomingMissileComponent* missile) {
        RunIsolated(entityManager, entity, "HomingMissileSystem", [&]() {
            missile->ageMs += deltaMs;
            if (missile->ageMs > HomingMissileComponent::LIFETIME_MS) {
                entityManager.DestroyEntity(entity);
                return;
            }

            if (!entityManager.IsHandleValid(missile->target)) {
                missile->target = FindNearestMissileTarget(entityManager, transform->getPosition());
            }

            if (const Transform* targetTransform = entityManager.IsHandleValid(missile->target)
                    ? entityManager.GetComponent<Transform>(missile->target.id) : nullptr) {
                float targetAngle = Vec2::Angle(targetTransform->getPosition() - transform->getPosition());
                SteerToward(*transform, targetAngle, HomingMissileComponent::TURN_SPEED * deltaTime);
                kinematics->velocity = Vec2::FromAngle(transform->getRotation(), HomingMissileComponent::SPEED);
            }

            Integrate(entityManager, entity, *transform, *kinematics, deltaTime, ctx.config);

            glm::vec2 position = transform->getPosition();
            if (position.x < 0.0f) position.x = width;
            else if (position.x > width) position.x = 0.0f;
            if (position.y < 0.0f) position.y = height;
            else if (position.y > height) position.y = 0.0f;
            transform->setPosition(position);
        });
    });
}

void ShieldSystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    const float deltaMs = deltaTime * 1000.0f;

    auto query = entityManager.CreateQuery<Transform, ShieldComponent>();
    for (auto [entity, transform, shield] : query) {
        const Transform* owner = entityManager.IsHandleValid(shield->owner)
            ? entityManager.GetComponent<Transform>(shield->owner.id) : nullptr;
        if (!owner) {
            entityManager.DestroyEntity(entity);
            continue;
        }

        transform->setPosition(owner->getPosition());
        shield->remainingMs -= deltaMs;
    }
}

void AsteroidSystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    auto query = entityManager.CreateQuery<Transform, Kinematics, AsteroidComponent>();
    query.ForEach([&](Entity entity, Transform* transform, Kinematics* kinematics, AsteroidComponent* rock) {
        RunIsolated(entityManager, entity, "AsteroidSystem", [&]() {
            transform->rotate(rock->spin * deltaTime);
            Integrate(entityManager, entity, *transform, *kinematics, deltaTime, ctx.config);
        });
    });
}

void BulletSystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    const float deltaMs = deltaTime * 1000.0f;

    auto query = entityManager.CreateQuery<Transform, Kinematics, BulletComponent>();
    query.ForEach([&](Entity entity, Transform* transform, Kinematics* kinematics, BulletComponent* bullet) {
        RunIsolated(entityManager, entity, "BulletSystem", [&]() {
            bullet->ageMs += deltaMs;
            if (bullet->ageMs >= BulletComponent::LIFETIME_MS) {
                if (bullet->pierced.empty()) {
                    ctx.combo.OnMiss();
                }
                entityManager.DestroyEntity(entity);
                return;
            }
            Integrate(entityManager, entity, *transform, *kinematics, deltaTime, ctx.config);
        });
    });
}

void PowerUpSystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    std::optional<glm::vec2> shipPosition;
    if (ctx.weapons.HasPowerUp(PowerUpType::Magnet)) {
        shipPosition = ShipPosition(entityManager, ctx);
    }

    auto query = entityManager.CreateQuery<Transform, Kinematics, PowerUpComponent>();
    query.ForEach([&](Entity entity, Transform* transform, Kinematics* kinematics, PowerUpComponent* powerUp) {
        RunIsolated(entityManager, entity, "PowerUpSystem", [&]() {
            kinematics->velocity *= PowerUpComponent::FRICTION;

            if (shipPosition) {
                glm::vec2 toShip = *shipPosition - transform->getPosition();
                float distance = Vec2::Magnitude(toShip);
                if (distance > 0.0f && distance < MAGNET_RANGE) {
                    kinematics->velocity += toShip * (MAGNET_PULL * deltaTime / distance);
                }
            }

            Integrate(entityManager, entity, *transform, *kinematics, deltaTime, ctx.config);
        });
    });
}

void PowerUpSpawnSystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    ctx.powerUpSpawnTimerMs += deltaTime * 1000.0f;

    float interval = ctx.config.powerUpSpawnIntervalMs / ctx.difficulty.GetSettings().powerUpSpawnRate;
    if (ctx.powerUpSpawnTimerMs < interval) {
        return;
    }
    ctx.powerUpSpawnTimerMs = 0.0f;

    if (!ctx.random.Chance(ctx.config.timedPowerUpChance)) {
        return;
    }

    const float width = ctx.config.worldWidth;
    const float height = ctx.config.worldHeight;
    PowerUpType type = static_cast<PowerUpType>(ctx.random.RangeInt(0, static_cast<int>(POWER_UP_TYPE_COUNT) - 1));
    glm::vec2 position(ctx.random.Range(SPAWN_MARGIN, width - SPAWN_MARGIN),
                       ctx.random.Range(SPAWN_MARGIN, height - SPAWN_MARGIN));

    std::optional<glm::vec2> ship = ShipPosition(entityManager, ctx);
    if (ship && Vec2::Distance(position, *ship) < MIN_SHIP_DISTANCE) {
        // Push it out to a ring around the ship, kept off the edges
        glm::vec2 moved = *ship + Vec2::FromAngle(ctx.random.Angle(), ctx.random.Range(250.0f, 400.0f));
        position = glm::vec2(std::clamp(moved.x, 50.0f, width - 50.0f),
                             std::clamp(moved.y, 50.0f, height - 50.0f));
    }

    CreatePowerUp(entityManager, ctx.random, type, position);
}

void ShieldExpirySystem::Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) {
    auto query = entityManager.CreateQuery<ShieldComponent>();
    for (auto [entity, shield] : query) {
        if (entityManager.IsActive(entity) && shield->IsExpired()) {
            Debug::Info("GameManager") << "Shield expired (" << shield->hitPoints << " hit points left)\n";
            entityManager.DestroyEntity(entity);
        }
    }
}
