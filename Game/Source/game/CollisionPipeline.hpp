#pragma once

#include "ecs/ecs_common.hpp"
#include "GameContext.hpp"

// Score for a base value under the current combo multiplier and difficulty
int ScoreValue(const GameContext& ctx, float baseScore);

// Credits a kill: the multiplier is read before the kill is registered with the
// combo tracker, and any milestone it returns is credited as well.
int CreditKill(GameContext& ctx, std::vector<EventEntry>& events, float baseScore);

// Destroys the asteroid, credits it and leaves its fragments in its place
void DestroyAsteroid(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events,
                     Entity asteroid, int scoreFactor, bool allowDrop);

void KillEnemy(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events,
               Entity enemy, int scoreFactor);

// A hazard touched the ship. Nothing happens while the ship is invulnerable;
// otherwise the shield absorbs the hit or the ship is destroyed.
// Returns true when the hit landed.
bool HitShip(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events);

// Removes the ship and its shield, takes a life and starts the respawn countdown
// while lives remain
void DestroyShip(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events);

// Routes the effect to the weapon ledger or to its special handler
void ApplyPowerUp(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events,
                  PowerUpType type, const glm::vec2& position);

void DefeatBoss(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events, Entity boss);

// Destroys every asteroid, crediting each without splitting it
void DetonateNuke(EntityManager& entityManager, GameContext& ctx, std::vector<EventEntry>& events);

// Teleports the ship to a point clear of asteroids and enemies
void PerformHyperspace(EntityManager& entityManager, GameContext& ctx, Entity ship);

// Pairwise collision resolution, once per tick after every entity moved.
// Every collection is captured at the start of the pass and walked in reverse;
// entities spawned during the pass take part from the next tick on, and
// entities destroyed during the pass are skipped.
class CollisionResolutionSystem : public ISystem {
public:
    static constexpr float BOSS_REWARD_RADIUS = 100.0f;
    static constexpr float HYPERSPACE_CLEARANCE = 100.0f;
    static constexpr int HYPERSPACE_ATTEMPTS = 10;

    explicit CollisionResolutionSystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;

private:
    void ShipVsHazards(EntityManager& entityManager, std::vector<EventEntry>& events, const std::vector<Entity>& hazards);
    void BulletsVsAsteroids(EntityManager& entityManager, std::vector<EventEntry>& events,
                            const std::vector<Entity>& bullets, const std::vector<Entity>& asteroids);
    void ShipVsPowerUps(EntityManager& entityManager, std::vector<EventEntry>& events, const std::vector<Entity>& powerUps);
    void BulletsVsEnemies(EntityManager& entityManager, std::vector<EventEntry>& events,
                          const std::vector<Entity>& bullets, const std::vector<Entity>& enemies);
    void BulletsVsBoss(EntityManager& entityManager, std::vector<EventEntry>& events, const std::vector<Entity>& bullets);
    void ShipVsBoss(EntityManager& entityManager, std::vector<EventEntry>& events);
    void ProjectilesVsShip(EntityManager& entityManager, std::vector<EventEntry>& events, const std::vector<Entity>& projectiles);
    void MissilesVsAsteroids(EntityManager& entityManager, std::vector<EventEntry>& events,
                             const std::vector<Entity>& missiles, const std::vector<Entity>& asteroids);
    void MissilesVsEnemies(EntityManager& entityManager, std::vector<EventEntry>& events,
                           const std::vector<Entity>& missiles, const std::vector<Entity>& enemies);

    GameContext& ctx;
};
