#pragma once
#include "LogMessage.hpp"
#include "ThreadSafeQueue.hpp"
#include "FileOutput.hpp"
#include <unordered_map>
#include <string>
#include <thread>
#include <atomic>
#include <mutex>
#include <cstddef>

// Owns the worker thread that moves messages from the queue to the console
// and the session file. Until Start the queue holds at most
// BACKLOG_CAPACITY messages, so binaries that never start the router keep
// only the most recent ones.
class LogRouter {
public:
    static constexpr size_t BACKLOG_CAPACITY = 4096;

    static LogRouter& Instance();

    void Start(const LogSettings& settings);
    void Stop();
    bool IsRunning() const { return running; }

    void SetChannelEnabled(const std::string& channel, bool enabled);
    bool IsChannelEnabled(const std::string& channel);

    void Enqueue(LogMessage msg);

    size_t GetDroppedCount() const { return dropped; }
    std::string GetLogFilePath();

    static std::string ResolveDirectory(const LogSettings& settings);
    static std::string MakeFileName(const std::string& productName);

private:
    LogRouter();
    ~LogRouter();

    void OpenFile(const LogSettings& settings);
    void RouterThread();

    ThreadSafeQueue<LogMessage> queue{ BACKLOG_CAPACITY };

    std::atomic<LogLevel> consoleLevel{ LogLevel::Warning };
    std::atomic<bool> running{ false };
    std::atomic<size_t> dropped{ 0 };
    std::thread worker;

    std::mutex channelMutex;
    std::unordered_map<std::string, bool> channelStates;

    std::mutex fileMutex;
    FileOutput fileOutput;
};
