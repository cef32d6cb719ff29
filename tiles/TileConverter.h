#pragma once

#include <vector>

#include "TileTypes.h"
#include "plugins/PixelSource.h"

namespace LvTiles {

/**
 * @brief Converts a single tile: decode, encode, write.
 *
 * Holds no per-task state, so one instance serves every worker thread.
 */
class TileConverter {
public:
    // expectedTileSize of 0 disables the size warning
    explicit TileConverter(const PixelSource& source, int expectedTileSize = 0);

    // Never throws; every failure is folded into the returned outcome
    ConversionOutcome convert(const TileTask& task) const;

private:
    void writeTile(const TileTask& task, const std::vector<uint8_t>& bytes, ConversionOutcome& outcome) const;

    const PixelSource& source_;
    int expectedTileSize_;
};

} // namespace LvTiles
