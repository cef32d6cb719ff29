#include "BatchScheduler.h"

#include <future>

#include "core/Logging/Logging.h"
#include "core/Scheduling/TaskScheduler.h"

namespace LvTiles {

BatchScheduler::BatchScheduler(const TileConverter& converter)
    : converter_(converter) {}

BatchReport BatchScheduler::run(const std::vector<TileTask>& tasks, int concurrency) {
    BatchReport report;

    if (tasks.empty()) {
        Log(MESSAGE, "Batch", "Nothing to do.");
        return report;
    }

    Log(MESSAGE, "Batch", "Converting {} tiles with {} thread(s)...", tasks.size(), concurrency < 1 ? 1 : concurrency);

    if (concurrency <= 1) {
        runSerial(tasks, report);
    } else {
        runParallel(tasks, static_cast<size_t>(concurrency), report);
    }

    return report;
}

void BatchScheduler::runSerial(const std::vector<TileTask>& tasks, BatchReport& report) {
    report.outcomes.reserve(tasks.size());
    for (const auto& task : tasks) {
        record(converter_.convert(task), report);
    }
}

void BatchScheduler::runParallel(const std::vector<TileTask>& tasks, size_t concurrency, BatchReport& report) {
    report.outcomes.reserve(tasks.size());

    TaskScheduler scheduler(concurrency);
    std::vector<std::future<void>> pending;
    pending.reserve(tasks.size());

    for (size_t i = 0; i < tasks.size(); ++i) {
        const TileTask& task = tasks[i];
        pending.push_back(scheduler.submitTask(
            [this, &task, &report] { record(converter_.convert(task), report); },
            "tile_" + std::to_string(i)));
    }

    // Join barrier: every tile has either been written or reported as failed
    for (auto& future : pending) {
        try {
            future.get();
        } catch (const std::exception& e) {
            Log(ERROR, "Batch", "Worker failed outside tile conversion: {}", e.what());
        }
    }
}

void BatchScheduler::record(ConversionOutcome outcome, BatchReport& report) {
    const std::string source = outcome.task.sourcePath.string();

    if (outcome.succeeded()) {
        Log(MESSAGE, "Batch", "OK {} -> {}", source, outcome.task.destPath.string());
    } else {
        Log(ERROR, "Batch", "Failed to convert {} ({}): {}",
            source, ConversionStatusName(outcome.status), outcome.reason);
    }

    std::lock_guard<std::mutex> lock(reportMutex_);
    report.outcomes.push_back(std::move(outcome));
}

} // namespace LvTiles
