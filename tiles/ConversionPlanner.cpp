#include "ConversionPlanner.h"

#include "core/Logging/Logging.h"

namespace LvTiles {

void ConversionPlanner::consider(const TileTask& candidate, bool force, Plan& result) {
    std::error_code ec;
    if (!force && std::filesystem::is_regular_file(candidate.destPath, ec)) {
        Log(MESSAGE, "Planner", "Skip {}", candidate.destPath.string());
        result.skipped++;
        return;
    }
    result.tasks.push_back(candidate);
}

ConversionPlanner::Plan ConversionPlanner::plan(const TileTreeDiscovery& discovery, bool force) {
    Plan result;
    discovery.forEach([&](const TileTask& candidate) { consider(candidate, force, result); });
    return result;
}

ConversionPlanner::Plan ConversionPlanner::plan(const std::vector<TileTask>& candidates, bool force) {
    Plan result;
    for (const auto& candidate : candidates) {
        consider(candidate, force, result);
    }
    return result;
}

} // namespace LvTiles
