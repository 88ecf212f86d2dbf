#pragma once

#include "ecs/ecs_common.hpp"
#include "ecs/Collisions/CircleCollider2D.hpp"
#include "Boss.hpp"
#include "Components.hpp"
#include "Difficulty.hpp"
#include "GameConfig.hpp"
#include "WeaponSystem.hpp"
#include "Utils/Random.hpp"
#include <optional>
#include <vector>

// Registers every component type the game attaches to entities
void RegisterGameComponents(EntityManager& entityManager);

Entity CreateShip(EntityManager& entityManager, const glm::vec2& position);

// 8 to 11 vertices at radius * [0.7, 1.0]
std::vector<glm::vec2> GenerateAsteroidOutline(float radius, Random& random);

Entity CreateAsteroid(EntityManager& entityManager, Random& random, AsteroidSize size,
                      const glm::vec2& position, const glm::vec2& velocity);

// Large asteroid anywhere in the world, away from the safe zone when one is given
Entity CreateRandomAsteroid(EntityManager& entityManager, const GameConfig& config,
                            const DifficultyManager& difficulty, Random& random,
                            const std::optional<glm::vec2>& safeZone);

// Fragments of a destroyed asteroid: none for Small, otherwise two of the next size.
// The asteroid itself is left to the caller.
std::vector<Entity> SplitAsteroid(EntityManager& entityManager, const DifficultyManager& difficulty,
                                  Random& random, Entity asteroid);

Entity CreateBullet(EntityManager& entityManager, const BulletSpec& spec);

Entity CreateEnemy(EntityManager& entityManager, Random& random, EnemyType type,
                   const glm::vec2& position, float speedMultiplier);

Entity CreateBoss(EntityManager& entityManager, BossType type, const glm::vec2& position);

Entity CreateBossProjectile(EntityManager& entityManager, const glm::vec2& position, const glm::vec2& direction);

Entity CreateHomingMissile(EntityManager& entityManager, const glm::vec2& position, float heading);

Entity CreatePowerUp(EntityManager& entityManager, Random& random, PowerUpType type, const glm::vec2& position);

PowerUpType RandomClassicPowerUp(Random& random);

// Shield bound to the ship's handle; NULL_ENTITY if the ship is not active
Entity CreateShield(EntityManager& entityManager, Entity ship, float durationMs);
