#include "LogRouter.hpp"
#include "ConsoleOutput.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace {

LogMessage RouterMessage(LogLevel level, const std::string& text) {
    LogMessage msg;
    msg.level = level;
    msg.text = text;
    msg.channel = "LogRouter";
    msg.timestamp = std::chrono::system_clock::now();
    msg.threadId = std::this_thread::get_id();
    return msg;
}

}

LogRouter& LogRouter::Instance() {
    static LogRouter instance;
    return instance;
}

LogRouter::LogRouter() {}

LogRouter::~LogRouter() {
    Stop();
}

std::string LogRouter::ResolveDirectory(const LogSettings& settings) {
    if (!settings.directory.empty())
        return settings.directory;

    if (const char* overrideDir = std::getenv("STARFALL_LOG_DIR")) {
        if (*overrideDir != '\0')
            return overrideDir;
    }
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / ".starfall" / "logs").string();
    }
    return std::string();
}

std::string LogRouter::MakeFileName(const std::string& productName) {
    std::string stem = productName.empty() ? "starfall" : productName;
    std::transform(stem.begin(), stem.end(), stem.begin(), [](unsigned char c) {
        return std::isalnum(c) ? static_cast<char>(std::tolower(c)) : '_';
    });

    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm;
    localtime_r(&time, &tm);

    std::ostringstream name;
    name << stem << "_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << "_" << getpid() << ".log";
    return name.str();
}

void LogRouter::OpenFile(const LogSettings& settings) {
    std::string folder = ResolveDirectory(settings);
    if (folder.empty()) {
        std::cerr << "WARN  LogRouter: no log directory, file output disabled\n";
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(folder, ec);
    if (ec) {
        std::cerr << "WARN  LogRouter: cannot create " << folder << ": " << ec.message() << "\n";
        return;
    }

    std::string filepath = (std::filesystem::path(folder) / MakeFileName(settings.productName)).string();
    std::lock_guard<std::mutex> lock(fileMutex);
    if (!fileOutput.Open(filepath)) {
        std::cerr << "WARN  LogRouter: cannot open " << filepath << "\n";
    }
}

void LogRouter::Start(const LogSettings& settings) {
    consoleLevel = settings.consoleLevel;
    if (running)
        return;

    if (settings.fileOutput)
        OpenFile(settings);

    size_t lost = dropped.exchange(0);
    queue.SetCapacity(0);
    queue.Restart();
    if (lost > 0) {
        queue.Push(RouterMessage(LogLevel::Warning,
            std::to_string(lost) + " messages logged before startup were dropped\n"));
    }

    running = true;
    worker = std::thread(&LogRouter::RouterThread, this);
}

void LogRouter::Stop() {
    if (!running)
        return;

    running = false;
    queue.Stop();
    if (worker.joinable())
        worker.join();

    std::lock_guard<std::mutex> lock(fileMutex);
    fileOutput.Close();
    queue.SetCapacity(BACKLOG_CAPACITY);
}

void LogRouter::SetChannelEnabled(const std::string& channel, bool enabled) {
    std::lock_guard<std::mutex> lock(channelMutex);
    channelStates[channel] = enabled;
}

bool LogRouter::IsChannelEnabled(const std::string& channel) {
    std::lock_guard<std::mutex> lock(channelMutex);
    auto it = channelStates.find(channel);
    return it == channelStates.end() || it->second;
}

void LogRouter::Enqueue(LogMessage msg) {
    if (!queue.Push(std::move(msg)))
        ++dropped;
}

std::string LogRouter::GetLogFilePath() {
    std::lock_guard<std::mutex> lock(fileMutex);
    return fileOutput.GetPath();
}

void LogRouter::RouterThread() {
    LogMessage msg;
    while (queue.WaitPop(msg)) {
        if (!IsChannelEnabled(msg.channel))
            continue;

        if (IsAtLeast(msg.level, consoleLevel))
            ConsoleOutput::Write(msg);

        std::lock_guard<std::mutex> lock(fileMutex);
        fileOutput.Write(msg);
    }
}
