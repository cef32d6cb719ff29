#include "FileLogWriter.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace LvTiles {

FileLogWriter::FileLogWriter(const std::filesystem::path& path, LogLevel level)
    : LogWriter(level)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    logFile.open(path, std::ios::trunc);
    if (!logFile.is_open()) {
        // The logger is not up yet, so this can only go to stderr
        std::cerr << "Cannot open log file: " << path.string() << std::endl;
        return;
    }

    logFile << "=== lvtiles log started ===" << std::endl;
}

FileLogWriter::~FileLogWriter() {
    if (logFile.is_open()) {
        logFile << "=== lvtiles log ended ===" << std::endl;
        logFile.close();
    }
}

void FileLogWriter::WriteLogMessage(const LogMessage& msg) {
    if (!logFile.is_open()) {
        return;
    }

    std::lock_guard<std::mutex> lock(fileMutex);

    logFile << getCurrentTimestamp() << " [" << LogLevelName(msg.level) << "]["
            << msg.owner << "] "
            << msg.message << '\n';
}

void FileLogWriter::Flush() {
    std::lock_guard<std::mutex> lock(fileMutex);
    if (logFile.is_open()) {
        logFile.flush();
    }
}

std::string FileLogWriter::getCurrentTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return ss.str();
}

} // namespace LvTiles
