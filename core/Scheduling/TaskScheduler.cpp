#include "TaskScheduler.h"

#include <chrono>
#include <stdexcept>

namespace LvTiles {

TaskScheduler::TaskScheduler(size_t maxThreads) {
    if (maxThreads == 0) maxThreads = 1;

    Log(DEBUG, "TaskScheduler", "Starting {} worker thread(s)", maxThreads);

    workerThreads_.reserve(maxThreads);
    for (size_t i = 0; i < maxThreads; ++i) {
        workerThreads_.emplace_back(&TaskScheduler::workerThread, this);
    }
}

TaskScheduler::~TaskScheduler() {
    shutdown();
}

void TaskScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(taskQueueMutex_);
        if (shutdown_) return;
    }

    // Queued work still runs; workers only stop once the queue is empty
    waitForIdle();
    {
        std::lock_guard<std::mutex> lock(taskQueueMutex_);
        shutdown_ = true;
    }
    taskCondition_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    Log(DEBUG, "TaskScheduler", "TaskScheduler shutdown complete");
}

size_t TaskScheduler::getQueuedTasks() const {
    std::lock_guard<std::mutex> lock(taskQueueMutex_);
    return taskQueue_.size();
}

void TaskScheduler::waitForIdle() {
    std::unique_lock<std::mutex> lock(taskQueueMutex_);
    idleCondition_.wait(lock, [this] { return pendingTasks_ == 0; });
}

void TaskScheduler::enqueue(std::function<void()> task, const std::string& taskId) {
    {
        std::lock_guard<std::mutex> lock(taskQueueMutex_);
        if (shutdown_) {
            throw std::runtime_error("TaskScheduler is shut down, cannot queue " + taskId);
        }
        Log(DEBUG, "TaskScheduler", "Queueing task: id='{}'", taskId);
        taskQueue_.emplace(std::move(task), taskId);
        ++pendingTasks_;
    }
    taskCondition_.notify_one();
}

void TaskScheduler::workerThread() {
    while (true) {
        std::unique_lock<std::mutex> lock(taskQueueMutex_);
        taskCondition_.wait(lock, [this] { return shutdown_ || !taskQueue_.empty(); });

        if (taskQueue_.empty()) {
            // shutdown_ set and nothing left to run
            break;
        }

        ScheduledTask task = std::move(taskQueue_.front());
        taskQueue_.pop();
        lock.unlock();

        executeTask(std::move(task));
    }
}

void TaskScheduler::executeTask(ScheduledTask task) {
    activeThreads_++;
    auto startTime = std::chrono::steady_clock::now();

    // submitTask() routes exceptions into the future, this only guards raw callables
    try {
        task.task();
    } catch (const std::exception& e) {
        Log(ERROR, "TaskScheduler", "Task {} failed: {}", task.taskId, e.what());
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Log(DEBUG, "TaskScheduler", "Task {} finished in {}ms", task.taskId, duration.count());

    activeThreads_--;

    {
        std::lock_guard<std::mutex> lock(taskQueueMutex_);
        --pendingTasks_;
        if (pendingTasks_ == 0) {
            idleCondition_.notify_all();
        }
    }
}

std::string TaskScheduler::generateTaskId() {
    return "task_" + std::to_string(++taskIdCounter_);
}

} // namespace LvTiles
