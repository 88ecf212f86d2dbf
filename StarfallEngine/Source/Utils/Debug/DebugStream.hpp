#pragma once
#include <sstream>
#include <string>
#include "LogMessage.hpp"

// Collects one message and hands it to Debug::Write when it goes out of scope
class DebugStream {
public:
    DebugStream(LogLevel level, const std::string& channel);
    ~DebugStream();

    DebugStream(const DebugStream&) = delete;
    DebugStream& operator=(const DebugStream&) = delete;

    template<typename T>
    DebugStream& operator<<(const T& value) {
        buffer << value;
        return *this;
    }

    DebugStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        manip(buffer);
        return *this;
    }

private:
    std::ostringstream buffer;
    LogLevel level;
    std::string channel;
};
