#include "PowerUps.hpp"
#include "Utils/Debug/Debug.hpp"

namespace {

const std::array<PowerUpConfig, POWER_UP_TYPE_COUNT> POWER_UP_CONFIGS = {{
    { PowerUpType::RapidFire,     "Rapid Fire",     10000.0f, PowerUpRoute::Ledger },
    { PowerUpType::TripleShot,    "Triple Shot",     8000.0f, PowerUpRoute::Ledger },
    { PowerUpType::SpreadShot,    "Spread Shot",    12000.0f, PowerUpRoute::Ledger },
    { PowerUpType::PowerShot,     "Power Shot",      6000.0f, PowerUpRoute::Ledger },
    { PowerUpType::Shield,        "Shield",         15000.0f, PowerUpRoute::Special },
    { PowerUpType::Hyperspace,    "Hyperspace",         0.0f, PowerUpRoute::Special },
    { PowerUpType::SlowMotion,    "Slow Motion",     8000.0f, PowerUpRoute::Special },
    { PowerUpType::HomingMissile, "Homing Missile", 30000.0f, PowerUpRoute::Ledger },
    { PowerUpType::Nuke,          "Nuke",               0.0f, PowerUpRoute::Special },
    { PowerUpType::Magnet,        "Magnet",         12000.0f, PowerUpRoute::Ledger },
    { PowerUpType::Invincibility, "Invincibility",   8000.0f, PowerUpRoute::Special }
}};

}

void ReportConfigurationError(const std::string& what) {
#ifndef NDEBUG
    throw ConfigurationError(what);
#else
    Debug::Warning("Configuration") << "Ignoring effect: " << what << "\n";
#endif
}

bool IsValidPowerUpType(PowerUpType type) {
    return static_cast<size_t>(type) < POWER_UP_TYPE_COUNT;
}

const PowerUpConfig* FindPowerUpConfig(PowerUpType type) {
    if (!IsValidPowerUpType(type)) {
        ReportConfigurationError("Unknown power-up kind " + std::to_string(static_cast<int>(type)));
        return nullptr;
    }
    return &POWER_UP_CONFIGS[static_cast<size_t>(type)];
}

const char* PowerUpName(PowerUpType type) {
    if (!IsValidPowerUpType(type)) {
        return "Unknown";
    }
    return POWER_UP_CONFIGS[static_cast<size_t>(type)].name;
}
