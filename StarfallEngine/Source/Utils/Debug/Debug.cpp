#include "Debug.hpp"
#include "LogRouter.hpp"

void Debug::Initialize(const LogSettings& settings) {
    LogRouter::Instance().Start(settings);
}

void Debug::Shutdown() {
    LogRouter::Instance().Stop();
}

void Debug::SetChannelEnabled(const std::string& channel, bool enabled) {
    LogRouter::Instance().SetChannelEnabled(channel, enabled);
}

void Debug::Write(LogLevel level, const std::string& text, const std::string& channel) {
    LogMessage msg;
    msg.level = level;
    msg.text = text;
    msg.channel = channel;
    msg.timestamp = std::chrono::system_clock::now();
    msg.threadId = std::this_thread::get_id();
    LogRouter::Instance().Enqueue(std::move(msg));
}
