#pragma once

#include <mutex>
#include <vector>

#include "TileConverter.h"
#include "TileTypes.h"

namespace LvTiles {

/**
 * @brief Runs a planned batch, one outcome per task.
 *
 * With concurrency <= 1 tasks run in list order on the calling thread.
 * Otherwise they are fanned out over a TaskScheduler with exactly
 * `concurrency` workers and collected as they finish; run() returns only
 * after every task has completed or failed. A failing tile never stops the
 * batch and is never retried.
 */
class BatchScheduler {
public:
    explicit BatchScheduler(const TileConverter& converter);

    BatchReport run(const std::vector<TileTask>& tasks, int concurrency);

private:
    void runSerial(const std::vector<TileTask>& tasks, BatchReport& report);
    void runParallel(const std::vector<TileTask>& tasks, size_t concurrency, BatchReport& report);
    void record(ConversionOutcome outcome, BatchReport& report);

    const TileConverter& converter_;
    std::mutex reportMutex_;
};

} // namespace LvTiles
