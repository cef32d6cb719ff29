#pragma once

#include "Logging.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace LvTiles {

class LogWriter {
public:
    std::atomic<LogLevel> level;

    explicit LogWriter(LogLevel level)
        : level(level) {}
    virtual ~LogWriter() noexcept = default;

    void WriteLogMessage(LogLevel logLevel, const char* owner, const char* message)
    {
        WriteLogMessage(LogMessage(logLevel, owner, message));
    }
    virtual void WriteLogMessage(const struct LogMessage& msg) = 0;
    virtual void Flush() {};
};

/**
 * @brief Serialized log sink.
 *
 * Any thread may enqueue; a single consumer thread drains the queue and hands
 * each message to every writer whose level admits it. Writers therefore never
 * see two messages concurrently and lines from different producers are never
 * spliced together.
 */
class Logger {
public:
    using WriterPtr = std::shared_ptr<LogWriter>;

private:
    using QueueType = std::deque<LogMessage>;
    QueueType messageQueue;
    std::deque<WriterPtr> writers;

    bool running = true;
    bool processing = false;
    std::condition_variable cv;
    std::condition_variable drainedCv;
    std::mutex queueLock;
    std::mutex writerLock;
    std::thread loggingThread;

    void threadLoop();
    void ProcessMessages(const QueueType& queue);

public:
    explicit Logger(std::deque<WriterPtr> initialWriters);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void AddLogWriter(WriterPtr writer);
    void LogMsg(LogLevel level, const char* owner, const char* message);
    void LogMsg(LogMessage&& msg);

    // Blocks until every message enqueued so far has reached the writers.
    void Flush();
};

} // namespace LvTiles
