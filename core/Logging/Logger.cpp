#include "Logger.h"

namespace LvTiles {

Logger::Logger(std::deque<WriterPtr> initialWriters)
    : writers(std::move(initialWriters))
{
    loggingThread = std::thread(&Logger::threadLoop, this);
}

Logger::~Logger() {
    {
        std::lock_guard<std::mutex> lock(queueLock);
        running = false;
    }
    cv.notify_all();

    if (loggingThread.joinable()) {
        loggingThread.join();
    }

    std::lock_guard<std::mutex> lock(writerLock);
    for (const auto& writer : writers) {
        writer->Flush();
    }
}

void Logger::AddLogWriter(WriterPtr writer) {
    std::lock_guard<std::mutex> lock(writerLock);
    writers.push_back(std::move(writer));
}

void Logger::LogMsg(LogLevel level, const char* owner, const char* message) {
    LogMsg(LogMessage(level, owner, message));
}

void Logger::LogMsg(LogMessage&& msg) {
    {
        std::lock_guard<std::mutex> lock(queueLock);
        messageQueue.push_back(std::move(msg));
    }
    cv.notify_one();
}

void Logger::Flush() {
    {
        std::unique_lock<std::mutex> lock(queueLock);
        drainedCv.wait(lock, [this] { return messageQueue.empty() && !processing; });
    }

    std::lock_guard<std::mutex> lock(writerLock);
    for (const auto& writer : writers) {
        writer->Flush();
    }
}

void Logger::threadLoop() {
    while (true) {
        QueueType queue;

        {
            std::unique_lock<std::mutex> lock(queueLock);
            cv.wait(lock, [this] { return !messageQueue.empty() || !running; });

            if (!running && messageQueue.empty()) {
                break;
            }

            queue = std::move(messageQueue);
            messageQueue.clear();
            processing = true;
        }

        ProcessMessages(queue);

        {
            std::lock_guard<std::mutex> lock(queueLock);
            processing = false;
        }
        drainedCv.notify_all();
    }
    drainedCv.notify_all();
}

void Logger::ProcessMessages(const QueueType& queue) {
    std::lock_guard<std::mutex> lock(writerLock);

    for (const auto& msg : queue) {
        for (const auto& writer : writers) {
            if (msg.level <= writer->level.load()) {
                writer->WriteLogMessage(msg);
            }
        }
    }
}

} // namespace LvTiles
