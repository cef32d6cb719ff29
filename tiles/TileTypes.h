#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace LvTiles {

/**
 * @brief One source tile and the .bin it converts into.
 */
struct TileTask {
    std::filesystem::path sourcePath;
    std::filesystem::path destPath;

    bool operator==(const TileTask& other) const = default;
};

enum class ConversionStatus {
    Success,
    DecodeFailed,
    EncodeFailed
};

const char* ConversionStatusName(ConversionStatus status);

struct ConversionOutcome {
    TileTask task;
    ConversionStatus status = ConversionStatus::Success;
    std::string reason;
    // destPath was a stray directory that had to be removed first
    bool pathCollisionRecovered = false;
    uint16_t width = 0;
    uint16_t height = 0;

    bool succeeded() const { return status == ConversionStatus::Success; }
};

/**
 * @brief Outcomes of one batch, in the order tasks finished.
 */
struct BatchReport {
    std::vector<ConversionOutcome> outcomes;
    // Tiles the planner left alone because their output already existed
    size_t skipped = 0;

    size_t converted() const;
    size_t failed() const;
    bool empty() const { return outcomes.empty(); }
};

} // namespace LvTiles
