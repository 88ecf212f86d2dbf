#pragma once
#include "LogMessage.hpp"
#include <fstream>
#include <string>

// One log file per session, appended line by line
class FileOutput {
public:
    bool Open(const std::string& filepath);
    void Write(const LogMessage& msg);
    void Close();

    bool IsOpen() const { return file.is_open(); }
    const std::string& GetPath() const { return path; }

private:
    std::ofstream file;
    std::string path;
};
