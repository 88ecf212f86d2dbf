#include "Difficulty.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace {

const DifficultySettings EASY_SETTINGS   = { 0.7f, 0.8f, 0.6f, 0.8f, 1.5f, 0.8f, 1.3f,  8, 0.8f, 1.3f };
const DifficultySettings NORMAL_SETTINGS = { 1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 12, 1.0f, 1.0f };
const DifficultySettings HARD_SETTINGS   = { 1.3f, 1.2f, 1.4f, 1.2f, 0.8f, 1.3f, 0.8f, 16, 1.2f, 0.8f };
const DifficultySettings INSANE_SETTINGS = { 1.6f, 1.5f, 1.8f, 1.5f, 0.6f, 1.8f, 0.6f, 20, 1.4f, 0.6f };

}

DifficultyManager::DifficultyManager(DifficultyLevel level)
    : level(level) {
}

const DifficultySettings& DifficultyManager::GetSettings() const {
    return SettingsFor(level);
}

int DifficultyManager::GetScoreValue(float baseScore) const {
    return static_cast<int>(std::lround(baseScore * GetSettings().scoreMultiplier));
}

float DifficultyManager::GetAsteroidSpeed(float baseSpeed) const {
    return baseSpeed * GetSettings().asteroidSpeedMultiplier;
}

bool DifficultyManager::ShouldSpawnPowerUp(float baseChance, float roll) const {
    return roll < baseChance * GetSettings().powerUpSpawnRate;
}

float DifficultyManager::GetShieldDuration(float baseDuration) const {
    return baseDuration * GetSettings().shieldDurationMultiplier;
}

const DifficultySettings& DifficultyManager::SettingsFor(DifficultyLevel level) {
    switch (level) {
    case DifficultyLevel::Easy:   return EASY_SETTINGS;
    case DifficultyLevel::Normal: return NORMAL_SETTINGS;
    case DifficultyLevel::Hard:   return HARD_SETTINGS;
    case DifficultyLevel::Insane: return INSANE_SETTINGS;
    }
    return NORMAL_SETTINGS;
}

const char* DifficultyManager::LevelName(DifficultyLevel level) {
    switch (level) {
    case DifficultyLevel::Easy:   return "easy";
    case DifficultyLevel::Normal: return "normal";
    case DifficultyLevel::Hard:   return "hard";
    case DifficultyLevel::Insane: return "insane";
    }
    return "normal";
}

std::optional<DifficultyLevel> DifficultyManager::ParseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "easy") return DifficultyLevel::Easy;
    if (lower == "normal") return DifficultyLevel::Normal;
    if (lower == "hard") return DifficultyLevel::Hard;
    if (lower == "insane") return DifficultyLevel::Insane;
    return std::nullopt;
}
