#pragma once
#include "LogMessage.hpp"
#include "DebugStream.hpp"
#include <string>

// Logging facade. Every call only pushes onto the router queue. Messages
// logged before Initialize are kept (up to the router backlog) and written
// once it runs.
class Debug {
public:
    static void Initialize(const LogSettings& settings);
    // Writes every queued message and stops the router thread
    static void Shutdown();

    static void SetChannelEnabled(const std::string& channel, bool enabled);

    static void Write(LogLevel level, const std::string& text, const std::string& channel = "General");

    static DebugStream Info(const std::string& channel = "General") {
        return DebugStream(LogLevel::Info, channel);
    }
    static DebugStream Warning(const std::string& channel = "General") {
        return DebugStream(LogLevel::Warning, channel);
    }
    static DebugStream Error(const std::string& channel = "General") {
        return DebugStream(LogLevel::Error, channel);
    }
    static DebugStream Critical(const std::string& channel = "General") {
        return DebugStream(LogLevel::Critical, channel);
    }
};
