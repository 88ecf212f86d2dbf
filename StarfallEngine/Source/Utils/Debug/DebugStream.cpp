#include "DebugStream.hpp"
#include "Debug.hpp"

DebugStream::DebugStream(LogLevel level_, const std::string& channel_)
    : level(level_), channel(channel_) {
}

DebugStream::~DebugStream() {
    std::string text = buffer.str();
    if (!text.empty())
        Debug::Write(level, text, channel);
}
