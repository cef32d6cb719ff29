#include "ConversionLedger.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

#include "core/Logging/Logging.h"

namespace fs = std::filesystem;

namespace LvTiles {

namespace {

std::string nowIso8601() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace

ConversionLedger::ConversionLedger(const std::string& path)
    : path_(path) {
    std::error_code ec;
    fs::path ledgerPath(path);
    if (ledgerPath.has_parent_path()) {
        fs::create_directories(ledgerPath.parent_path(), ec);
    }

    ledger_.open(path, std::ios::out | std::ios::trunc);
    if (!ledger_.is_open()) {
        Log(ERROR, "Ledger", "Cannot open report file: {}", path);
    }
}

ConversionLedger::~ConversionLedger() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (ledger_.is_open()) {
        ledger_.close();
    }
}

void ConversionLedger::writeLineUnsafe(const std::string& line) {
    if (!ledger_.is_open()) {
        return;
    }
    ledger_ << line << '\n';
    ledger_.flush();
    if (ledger_.fail()) {
        Log(ERROR, "Ledger", "Write to {} failed, closing report", path_);
        ledger_.close();
    }
}

void ConversionLedger::startBatch(size_t planned, size_t skipped, int concurrency, bool force) {
    nlohmann::json entry = {
        {"event", "batch_start"},
        {"ts", nowIso8601()},
        {"total", planned},
        {"skipped", skipped},
        {"jobs", concurrency},
        {"force", force}
    };

    std::lock_guard<std::mutex> lock(mtx_);
    writeLineUnsafe(entry.dump());
}

void ConversionLedger::recordOutcome(const ConversionOutcome& outcome) {
    nlohmann::json entry = {
        {"event", "tile"},
        {"ts", nowIso8601()},
        {"source", outcome.task.sourcePath.string()},
        {"dest", outcome.task.destPath.string()},
        {"status", ConversionStatusName(outcome.status)}
    };

    if (!outcome.reason.empty()) {
        entry["reason"] = outcome.reason;
    }
    if (outcome.width != 0 || outcome.height != 0) {
        entry["width"] = outcome.width;
        entry["height"] = outcome.height;
    }
    if (outcome.pathCollisionRecovered) {
        entry["removedDirectory"] = true;
    }

    std::lock_guard<std::mutex> lock(mtx_);
    writeLineUnsafe(entry.dump());
}

void ConversionLedger::endBatch(const BatchReport& report) {
    nlohmann::json entry = {
        {"event", "batch_end"},
        {"ts", nowIso8601()},
        {"converted", report.converted()},
        {"failed", report.failed()},
        {"skipped", report.skipped}
    };

    std::lock_guard<std::mutex> lock(mtx_);
    writeLineUnsafe(entry.dump());
}

void ConversionLedger::recordBatch(const BatchReport& report, int concurrency, bool force) {
    startBatch(report.outcomes.size(), report.skipped, concurrency, force);
    for (const auto& outcome : report.outcomes) {
        recordOutcome(outcome);
    }
    endBatch(report);
}

} // namespace LvTiles
