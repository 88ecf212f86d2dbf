#include "FileOutput.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>

bool FileOutput::Open(const std::string& filepath) {
    Close();
    file.open(filepath, std::ios::out | std::ios::app);
    if (!file.is_open())
        return false;
    path = filepath;
    return true;
}

void FileOutput::Write(const LogMessage& msg) {
    if (!file.is_open())
        return;

    auto seconds = std::chrono::system_clock::to_time_t(msg.timestamp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        msg.timestamp.time_since_epoch()).count() % 1000;
    std::tm tm;
    localtime_r(&seconds, &tm);

    file << std::put_time(&tm, "%H:%M:%S") << '.'
         << std::setw(3) << std::setfill('0') << millis << std::setfill(' ')
         << " " << LevelToString(msg.level)
         << " <" << msg.threadId << "> "
         << msg.channel << ": " << msg.text;

    if (IsAtLeast(msg.level, LogLevel::Error))
        file.flush();
}

void FileOutput::Close() {
    if (file.is_open())
        file.close();
    path.clear();
}
