#pragma once
#include <string>
#include <chrono>
#include <thread>

enum class LogLevel {
    Info = 0,
    Warning,
    Error,
    Critical
};

struct LogMessage {
    LogLevel level = LogLevel::Info;
    std::string text;
    std::string channel;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

// What Debug::Initialize sets up. An empty directory means
// $STARFALL_LOG_DIR, then $HOME/.starfall/logs.
struct LogSettings {
    std::string productName = "Starfall";
    LogLevel consoleLevel = LogLevel::Warning;
    bool fileOutput = true;
    std::string directory;
};

inline bool IsAtLeast(LogLevel level, LogLevel threshold) {
    return static_cast<int>(level) >= static_cast<int>(threshold);
}

inline const char* LevelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Info:     return "INFO ";
    case LogLevel::Warning:  return "WARN ";
    case LogLevel::Error:    return "ERROR";
    case LogLevel::Critical: return "FATAL";
    }
    return "?????";
}
