#pragma once

#include <vector>

#include "TileTreeDiscovery.h"
#include "TileTypes.h"

namespace LvTiles {

/**
 * @brief Turns discovered tiles into the list of conversions to run.
 *
 * Without force, a tile whose .bin already exists as a regular file is
 * skipped. Nothing is written to disk.
 */
class ConversionPlanner {
public:
    struct Plan {
        std::vector<TileTask> tasks;
        size_t skipped = 0;
    };

    static Plan plan(const TileTreeDiscovery& discovery, bool force);
    static Plan plan(const std::vector<TileTask>& candidates, bool force);

private:
    static void consider(const TileTask& candidate, bool force, Plan& result);
};

} // namespace LvTiles
