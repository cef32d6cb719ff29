#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "core/Logging/Logging.h"

namespace LvTiles {

/**
 * @brief Internal task representation
 */
struct ScheduledTask {
    std::function<void()> task;
    std::string taskId;

    ScheduledTask(std::function<void()> t, std::string id)
        : task(std::move(t)), taskId(std::move(id)) {}
};

/**
 * @brief Fixed-size worker pool with FIFO dispatch.
 *
 * Exactly maxThreads workers are started by the constructor and joined by
 * shutdown()/the destructor. submitTask() hands back a future that carries
 * the callable's result or exception. waitForIdle() is the join barrier: it
 * returns once every task submitted so far has finished running.
 */
class TaskScheduler {
public:
    explicit TaskScheduler(size_t maxThreads);
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    template<typename F>
    auto submitTask(F&& f, const std::string& taskId = "") -> std::future<decltype(f())>;

    void waitForIdle();
    void shutdown();

    size_t getMaxThreads() const { return workerThreads_.size(); }
    size_t getActiveThreads() const { return activeThreads_; }
    size_t getQueuedTasks() const;

private:
    void workerThread();
    void executeTask(ScheduledTask task);
    void enqueue(std::function<void()> task, const std::string& taskId);
    std::string generateTaskId();

    std::vector<std::thread> workerThreads_;
    std::atomic<size_t> activeThreads_{0};

    std::queue<ScheduledTask> taskQueue_;
    // Guarded by taskQueueMutex_
    bool shutdown_ = false;
    // Queued plus running; guarded by taskQueueMutex_
    size_t pendingTasks_ = 0;
    mutable std::mutex taskQueueMutex_;
    std::condition_variable taskCondition_;
    std::condition_variable idleCondition_;

    std::atomic<uint64_t> taskIdCounter_{0};
};

template<typename F>
auto TaskScheduler::submitTask(F&& f, const std::string& taskId) -> std::future<decltype(f())> {
    using ReturnType = decltype(f());
    auto taskPromise = std::make_shared<std::promise<ReturnType>>();
    auto future = taskPromise->get_future();

    auto wrappedTask = [taskPromise, capturedFunction = std::forward<F>(f)]() mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                capturedFunction();
                taskPromise->set_value();
            } else {
                taskPromise->set_value(capturedFunction());
            }
        } catch (...) {
            taskPromise->set_exception(std::current_exception());
        }
    };

    enqueue(std::move(wrappedTask), taskId.empty() ? generateTaskId() : taskId);
    return future;
}

} // namespace LvTiles
