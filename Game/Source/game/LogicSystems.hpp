#pragma once

#include "ecs/ecs_common.hpp"
#include "GameContext.hpp"

// Per-entity updates run in registration order by the ECSWorld. Each entity is
// updated in isolation: a failure is logged and that entity is destroyed.
// deltaTime is in seconds of scaled simulation time.

// Applies the tick's controls, moves the ship and fires
class ShipSystem : public ISystem {
public:
    explicit ShipSystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;
private:
    GameContext& ctx;
};

class WeaponTimerSystem : public ISystem {
public:
    explicit WeaponTimerSystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;
private:
    GameContext& ctx;
};

// Ticks the wave director and materializes what it requested
class WaveSpawnSystem : public ISystem {
public:
    explicit WaveSpawnSystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;
private:
    GameContext& ctx;
};

// Boss movement and volleys
class BossSystem : public ISystem {
public:
    explicit BossSystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;
private:
    GameContext& ctx;
};

class BossProjectileSystem : public ISystem {
public:
    explicit BossProjectileSystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;
private:
    GameContext& ctx;
};

class EnemySystem : public ISystem {
public:
    explicit EnemySystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;
private:
    GameContext& ctx;
};

// Steers missiles at their target, re-acquiring the nearest asteroid or enemy when it is gone
class HomingMissileSystem : public ISystem {
public:
    explicit HomingMissileSystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;
private:
    GameContext& ctx;
};

// Keeps the shield on its owner and counts its time down
class ShieldSystem : public ISystem {
public:
    explicit ShieldSystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;
private:
    GameContext& ctx;
};

class AsteroidSystem : public ISystem {
public:
    explicit AsteroidSystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;
private:
    GameContext& ctx;
};

// Moves bullets and expires them; a bullet that expires without a hit breaks the combo
class BulletSystem : public ISystem {
public:
    explicit BulletSystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;
private:
    GameContext& ctx;
};

// Drifting pickups, pulled toward the ship while the magnet is active
class PowerUpSystem : public ISystem {
public:
    static constexpr float MAGNET_RANGE = 300.0f;
    static constexpr float MAGNET_PULL = 200.0f;   // px/s^2

    explicit PowerUpSystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;
private:
    GameContext& ctx;
};

// Periodic random pickup somewhere away from the ship
class PowerUpSpawnSystem : public ISystem {
public:
    static constexpr float SPAWN_MARGIN = 150.0f;
    static constexpr float MIN_SHIP_DISTANCE = 200.0f;

    explicit PowerUpSpawnSystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;
private:
    GameContext& ctx;
};

// Discards shields that ran out of hit points or time
class ShieldExpirySystem : public ISystem {
public:
    explicit ShieldExpirySystem(GameContext& ctx) : ctx(ctx) {}
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override;
private:
    GameContext& ctx;
};
