#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "tiles/TileTypes.h"

namespace LvTiles {

/**
 * @brief JSON Lines record of one conversion batch.
 *
 * One object per line: a batch_start event, one tile event per outcome and
 * a batch_end event with the totals. Lines are appended under a mutex and
 * the file is flushed on every event.
 */
class ConversionLedger {
public:
    explicit ConversionLedger(const std::string& path);
    ~ConversionLedger();

    ConversionLedger(const ConversionLedger&) = delete;
    ConversionLedger& operator=(const ConversionLedger&) = delete;

    bool isOpen() const { return ledger_.is_open(); }

    void startBatch(size_t planned, size_t skipped, int concurrency, bool force);
    void recordOutcome(const ConversionOutcome& outcome);
    void endBatch(const BatchReport& report);

    // Convenience: start, every outcome, end
    void recordBatch(const BatchReport& report, int concurrency, bool force);

private:
    void writeLineUnsafe(const std::string& line);

    std::string path_;
    std::mutex mtx_;
    std::ofstream ledger_;
};

} // namespace LvTiles
