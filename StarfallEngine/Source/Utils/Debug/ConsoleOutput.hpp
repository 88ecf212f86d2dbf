#pragma once
#include "LogMessage.hpp"

class ConsoleOutput {
public:
    // Info goes to stdout, warnings and worse to stderr
    static void Write(const LogMessage& msg);
};
