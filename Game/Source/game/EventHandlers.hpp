#pragma once
#include "ecs/Events/ecs_event_processor.hpp"
#include "Utils/Debug/Debug.hpp"
#include "Boss.hpp"
#include "Events.hpp"
#include "PowerUps.hpp"

#include <memory>

// Presentation-side handlers for drained game events. The headless driver only
// logs them; a renderer would hang its floating texts and sounds here.

class ScoreChangedHandler : public IEventHandler {
public:
    void Handle(const GameEventBlob& event) override {
        auto data = ReadEventPayload<ScoreChangedEventData>(event);
        Debug::Info("Starfall") << "+" << data.delta << " (" << data.total << ")\n";
    }
};

class LifeLostHandler : public IEventHandler {
public:
    void Handle(const GameEventBlob& event) override {
        auto data = ReadEventPayload<LifeLostEventData>(event);
        Debug::Info("Starfall") << "Ship lost at (" << data.x << ", " << data.y << "), "
                                << data.livesRemaining << " lives remaining\n";
    }
};

class AchievementHandler : public IEventHandler {
public:
    void Handle(const GameEventBlob& event) override {
        auto data = ReadEventPayload<AchievementEventData>(event);
        Debug::Info("Starfall") << "Achievement: " << data.text << " (+" << data.points << ")\n";
    }
};

// Wave start and wave clear share the payload
class WaveHandler : public IEventHandler {
public:
    void Handle(const GameEventBlob& event) override {
        auto data = ReadEventPayload<WaveEventData>(event);
        if (event.type == WAVE_STARTED) {
            Debug::Info("Starfall") << "Wave " << data.wave << " started, " << data.enemyCount << " enemies\n";
        } else {
            Debug::Info("Starfall") << "Wave " << data.wave << " cleared, bonus " << data.bonus << "\n";
        }
    }
};

class BossHandler : public IEventHandler {
public:
    void Handle(const GameEventBlob& event) override {
        auto data = ReadEventPayload<BossEventData>(event);
        const char* name = BossName(static_cast<BossType>(data.bossType));
        switch (event.type) {
        case BOSS_INTRO:
            Debug::Info("Starfall") << "Warning: " << name << " approaching\n";
            break;
        case BOSS_SPAWNED:
            Debug::Info("Starfall") << name << " entered the field\n";
            break;
        default:
            Debug::Info("Starfall") << name << " defeated, +" << data.score << "\n";
            break;
        }
    }
};

class PowerUpCollectedHandler : public IEventHandler {
public:
    void Handle(const GameEventBlob& event) override {
        auto data = ReadEventPayload<PowerUpCollectedEventData>(event);
        PowerUpType type = static_cast<PowerUpType>(data.type);
        Debug::Info("Starfall") << "Picked up " << (IsValidPowerUpType(type) ? PowerUpName(type) : "unknown") << "\n";
    }
};

class LevelClearedHandler : public IEventHandler {
public:
    void Handle(const GameEventBlob& event) override {
        auto data = ReadEventPayload<LevelClearedEventData>(event);
        Debug::Info("Starfall") << "Level " << data.level << " reached, bonus " << data.bonus << "\n";
    }
};

class GameOverHandler : public IEventHandler {
public:
    void Handle(const GameEventBlob& event) override {
        auto data = ReadEventPayload<GameOverEventData>(event);
        Debug::Info("Starfall") << "Game over: score " << data.score << ", wave " << data.wave
                                << ", level " << data.level << "\n";
    }
};

inline void RegisterLoggingHandlers(EventProcessor& processor) {
    processor.RegisterHandler(SCORE_CHANGED, std::make_unique<ScoreChangedHandler>());
    processor.RegisterHandler(LIFE_LOST, std::make_unique<LifeLostHandler>());
    processor.RegisterHandler(ACHIEVEMENT_UNLOCKED, std::make_unique<AchievementHandler>());
    processor.RegisterHandler(WAVE_STARTED, std::make_unique<WaveHandler>());
    processor.RegisterHandler(WAVE_CLEARED, std::make_unique<WaveHandler>());
    processor.RegisterHandler(BOSS_INTRO, std::make_unique<BossHandler>());
    processor.RegisterHandler(BOSS_SPAWNED, std::make_unique<BossHandler>());
    processor.RegisterHandler(BOSS_DEFEATED, std::make_unique<BossHandler>());
    processor.RegisterHandler(POWERUP_COLLECTED, std::make_unique<PowerUpCollectedHandler>());
    processor.RegisterHandler(LEVEL_CLEARED, std::make_unique<LevelClearedHandler>());
    processor.RegisterHandler(GAME_OVER, std::make_unique<GameOverHandler>());
}
