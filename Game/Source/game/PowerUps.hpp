#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

enum class PowerUpType : uint8_t {
    RapidFire = 0,
    TripleShot,
    SpreadShot,
    PowerShot,
    Shield,
    Hyperspace,
    SlowMotion,
    HomingMissile,
    Nuke,
    Magnet,
    Invincibility,
    Count
};

constexpr size_t POWER_UP_TYPE_COUNT = static_cast<size_t>(PowerUpType::Count);

// Where a collected power-up is applied
enum class PowerUpRoute : uint8_t {
    Ledger,   // timed effect kept by the WeaponSystem
    Special   // handled directly by the game (instant or stateful)
};

struct PowerUpConfig {
    PowerUpType type;
    const char* name;
    float durationMs;   // 0 for instant effects
    PowerUpRoute route;
};

// Thrown for inconsistent game configuration, such as an unknown power-up kind.
// It is a programming error: per-entity isolation never swallows it.
class ConfigurationError : public std::logic_error {
public:
    explicit ConfigurationError(const std::string& what) : std::logic_error(what) {}
};

// Throws ConfigurationError in debug builds. In release builds it logs a
// warning and returns, and the caller skips the effect.
void ReportConfigurationError(const std::string& what);

bool IsValidPowerUpType(PowerUpType type);

// Returns nullptr (after reporting) for an unknown kind
const PowerUpConfig* FindPowerUpConfig(PowerUpType type);

const char* PowerUpName(PowerUpType type);

// Kinds dropped by destroyed asteroids and boss rewards
constexpr std::array<PowerUpType, 8> CLASSIC_POWER_UPS = {
    PowerUpType::RapidFire,
    PowerUpType::TripleShot,
    PowerUpType::SpreadShot,
    PowerUpType::PowerShot,
    PowerUpType::Shield,
    PowerUpType::Hyperspace,
    PowerUpType::SlowMotion,
    PowerUpType::HomingMissile
};
