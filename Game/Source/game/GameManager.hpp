#pragma once

#include "ecs/ecs.hpp"
#include "ecs/Collisions/CircleCollider2D.hpp"
#include "Utils/Input.hpp"
#include "Utils/Random.hpp"
#include "ComboTracker.hpp"
#include "Difficulty.hpp"
#include "GameConfig.hpp"
#include "GameContext.hpp"
#include "TimeScale.hpp"
#include "WaveDirector.hpp"
#include "WeaponSystem.hpp"

#include <vector>

enum class GameState {
    Playing,
    GameOver
};

// Key codes fed to the Input state by the driver
enum class GameKey : int {
    Thrust = 1,
    TurnLeft,
    TurnRight,
    Fire,
    Missile,
    Shield,
    InfiniteLives
};

inline int KeyCode(GameKey key) { return static_cast<int>(key); }

// One drawable body in world space
struct EntityView {
    Entity entity;
    CollisionLayer kind;
    glm::vec2 position;
    float heading;
    float radius;
    int variant;                       // asteroid size, enemy type, boss phase or power-up type
    std::vector<glm::vec2> outline;    // asteroids only, local space
};

// Per-frame copy of everything the HUD and renderer need. Holds no pointers
// into the world.
struct GameSnapshot {
    GameState state;
    int score;
    int lives;
    int level;
    int wave;
    WaveState waveState;
    int enemiesRemaining;
    float waveProgress;
    bool shipAlive;
    bool shieldActive;
    bool bossAlive;
    float bossHealthRatio;
    int comboCount;
    float comboMultiplier;
    float timeScale;
    int homingMissileCharges;
    size_t asteroidCount;
    size_t enemyCount;
    size_t bulletCount;
    size_t powerUpCount;
    std::vector<ActiveEffect> activeEffects;
    std::vector<EntityView> entities;  // ascending entity id
};

// Receives the final result of a finished game
class IScoreRecorder {
public:
    virtual ~IScoreRecorder() = default;
    virtual void RecordFinalScore(int score, int wave) = 0;
};

// Owns one game session: the entity world, its systems in tick order and the
// shared services they use. Driven by Update with unscaled milliseconds.
class GameManager {
public:
    GameManager(const GameConfig& config, Random& random);

    void StartNewGame();

    // One simulation step. Does nothing once the game is over.
    void Update(float deltaMs, const Input& input);

    GameState GetState() const { return state; }
    int GetScore() const { return ctx.score; }
    int GetLives() const { return ctx.lives; }
    int GetLevel() const { return ctx.level; }
    int GetCurrentWave() const { return director.GetCurrentWave(); }

    GameSnapshot GetSnapshot();

    // Events produced since the last drain, in emission order
    std::vector<EventEntry> DrainEvents();

    // Not owned; may be null
    void SetScoreRecorder(IScoreRecorder* scoreRecorder) { recorder = scoreRecorder; }

    const EntityManager& GetEntityManager() const { return world.GetEntityManager(); }

    // Direct world access for tests and tools; presentation reads GetSnapshot
    EntityManager& GetMutableEntityManager() { return world.GetEntityManager(); }
    GameContext& GetContext() { return ctx; }
    const DifficultyManager& GetDifficulty() const { return difficulty; }

private:
    void RegisterSystems();
    void SpawnShip();
    void SpawnAsteroidField();
    bool CanRespawnSafely();
    void UpdateRespawn(float deltaMs);
    void HandleInput(const Input& input, std::vector<EventEntry>& events);
    void CheckWaveCompletion(std::vector<EventEntry>& events);
    void CheckLevelCompletion(std::vector<EventEntry>& events);
    void EnterGameOver(std::vector<EventEntry>& events);

    GameConfig config;
    Random& random;
    DifficultyManager difficulty;
    WeaponSystem weapons;
    WaveDirector director;
    ComboTracker combo;
    TimeScale timeScale;
    GameContext ctx;

    ECSWorld world;
    std::vector<EventEntry> drained;
    GameState state;
    IScoreRecorder* recorder;
};
