#include "Logging.h"
#include "Logger.h"
#include "ConsoleLogWriter.h"

#include <atomic>
#include <memory>

namespace LvTiles {

static std::unique_ptr<Logger> globalLogger;
static std::atomic<bool> loggingEnabled{true};

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case FATAL: return "FATAL";
        case ERROR: return "ERROR";
        case WARNING: return "WARNING";
        case MESSAGE: return "MESSAGE";
        case DEBUG: return "DEBUG";
        default: return "UNKNOWN";
    }
}

void ToggleLogging(bool enabled) {
    loggingEnabled = enabled;
}

void AddLogWriter(std::shared_ptr<LogWriter> writer) {
    if (globalLogger) {
        globalLogger->AddLogWriter(std::move(writer));
    }
}

void LogMsg(LogLevel level, const char* owner, const char* message) {
    if (!loggingEnabled || !globalLogger) {
        return;
    }

    globalLogger->LogMsg(level, owner, message);
}

void FlushLogs() {
    if (globalLogger) {
        globalLogger->Flush();
    }
}

void InitializeLogging(LogLevel consoleLevel) {
    if (globalLogger) {
        return;
    }

    std::deque<Logger::WriterPtr> writers;
    writers.push_back(std::make_shared<ConsoleLogWriter>(consoleLevel));

    globalLogger = std::make_unique<Logger>(std::move(writers));
}

void ShutdownLogging() {
    if (globalLogger) {
        FlushLogs();
        globalLogger.reset();
    }
}

} // namespace LvTiles
