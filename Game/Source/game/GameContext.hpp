#pragma once

#include "ecs/ecs.hpp"
#include "ComboTracker.hpp"
#include "Difficulty.hpp"
#include "Events.hpp"
#include "GameConfig.hpp"
#include "TimeScale.hpp"
#include "WaveDirector.hpp"
#include "WeaponSystem.hpp"
#include "Utils/Random.hpp"
#include <vector>

// Ship input for the current tick
struct ShipControls {
    bool thrust = false;
    bool turnLeft = false;
    bool turnRight = false;
    bool fire = false;
    bool missile = false;
};

// Session state shared by the game systems. Owned by the GameManager; systems
// receive it by reference and never keep entity pointers across ticks.
struct GameContext {
    const GameConfig& config;
    const DifficultyManager& difficulty;
    Random& random;
    WeaponSystem& weapons;
    WaveDirector& director;
    ComboTracker& combo;
    TimeScale& timeScale;

    ShipControls controls;

    float nowMs = 0.0f;     // simulation clock, scaled time
    int tick = 0;
    int score = 0;
    int lives = 0;
    int level = 1;

    EntityHandle shipHandle;
    EntityHandle shieldHandle;
    EntityHandle bossHandle;

    bool infiniteLives = false;
    bool respawning = false;
    float respawnTimerMs = 0.0f;
    float powerUpSpawnTimerMs = 0.0f;

    GameContext(const GameConfig& config, const DifficultyManager& difficulty, Random& random,
                WeaponSystem& weapons, WaveDirector& director, ComboTracker& combo, TimeScale& timeScale)
        : config(config), difficulty(difficulty), random(random)
        , weapons(weapons), director(director), combo(combo), timeScale(timeScale) {}

    template<typename T>
    void Emit(std::vector<EventEntry>& events, StarfallEventType type, const T& payload) const {
        events.push_back(MakeEventEntry(tick, type, payload));
    }

    // Adds already-scaled points and reports the change
    void AddScore(std::vector<EventEntry>& events, int delta);

    // Credits the achievement points and reports the unlock
    void UnlockAchievement(std::vector<EventEntry>& events, const Achievement& achievement);

    // Resolved ship entity, or NULL_ENTITY while dead or respawning
    Entity GetShip(const EntityManager& entityManager) const;
    Entity GetShield(const EntityManager& entityManager) const;
    Entity GetBoss(const EntityManager& entityManager) const;

    void ResetSession();
};
