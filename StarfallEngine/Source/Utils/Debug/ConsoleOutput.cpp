#include "ConsoleOutput.hpp"
#include <iostream>

void ConsoleOutput::Write(const LogMessage& msg) {
    std::ostream& out = IsAtLeast(msg.level, LogLevel::Warning) ? std::cerr : std::cout;
    out << LevelToString(msg.level) << " " << msg.channel << ": " << msg.text;
    if (msg.level != LogLevel::Info)
        out.flush();
}
