#include "GameContext.hpp"
#include <algorithm>
#include <cstring>

void GameContext::AddScore(std::vector<EventEntry>& events, int delta) {
    if (delta == 0) {
        return;
    }
    score += delta;
    Emit(events, SCORE_CHANGED, ScoreChangedEventData{ delta, score });
}

void GameContext::UnlockAchievement(std::vector<EventEntry>& events, const Achievement& achievement) {
    AchievementEventData data{};
    data.kind = static_cast<int>(achievement.kind);
    data.points = achievement.points;
    size_t len = std::min(achievement.text.size(), EVENT_TEXT_SIZE - 1);
    std::memcpy(data.text, achievement.text.data(), len);
    data.text[len] = '\0';
    Emit(events, ACHIEVEMENT_UNLOCKED, data);

    AddScore(events, achievement.points);
}

Entity GameContext::GetShip(const EntityManager& entityManager) const {
    return entityManager.IsHandleValid(shipHandle) ? shipHandle.id : NULL_ENTITY;
}

Entity GameContext::GetShield(const EntityManager& entityManager) const {
    return entityManager.IsHandleValid(shieldHandle) ? shieldHandle.id : NULL_ENTITY;
}

Entity GameContext::GetBoss(const EntityManager& entityManager) const {
    return entityManager.IsHandleValid(bossHandle) ? bossHandle.id : NULL_ENTITY;
}

void GameContext::ResetSession() {
    controls = ShipControls{};
    nowMs = 0.0f;
    tick = 0;
    score = 0;
    lives = config.startingLives;
    level = config.startingLevel;
    shipHandle = EntityHandle{};
    shieldHandle = EntityHandle{};
    bossHandle = EntityHandle{};
    infiniteLives = false;
    respawning = false;
    respawnTimerMs = 0.0f;
    powerUpSpawnTimerMs = 0.0f;
}
