#pragma once

#include "ecs/Events/GameEventBlob.hpp"
#include <cstdint>

// Fire-and-forget notifications for the presentation layer
enum StarfallEventType : uint8_t {
	SCORE_CHANGED = 0,
	LIFE_LOST = 1,
	ACHIEVEMENT_UNLOCKED = 2,
	WAVE_STARTED = 3,
	WAVE_CLEARED = 4,
	BOSS_INTRO = 5,
	BOSS_SPAWNED = 6,
	BOSS_DEFEATED = 7,
	POWERUP_COLLECTED = 8,
	LEVEL_CLEARED = 9,
	GAME_OVER = 10,
	SHOT_FIRED = 11
};

constexpr size_t EVENT_TEXT_SIZE = 48;

struct ScoreChangedEventData {
	int delta;
	int total;
};

struct LifeLostEventData {
	int livesRemaining;
	float x;
	float y;
};

struct AchievementEventData {
	int kind;
	int points;
	char text[EVENT_TEXT_SIZE];
};

struct WaveEventData {
	int wave;
	int bonus;
	int enemyCount;
};

struct BossEventData {
	int wave;
	int bossType;
	int score;
	float x;
	float y;
};

struct PowerUpCollectedEventData {
	int type;
	float x;
	float y;
};

struct LevelClearedEventData {
	int level;
	int bonus;
};

struct GameOverEventData {
	int score;
	int wave;
	int level;
};

struct ShotFiredEventData {
	int bulletCount;
	char sound[16];
};
