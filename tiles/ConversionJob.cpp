#include "ConversionJob.h"

#include <filesystem>
#include <memory>

#include "BatchScheduler.h"
#include "ConversionPlanner.h"
#include "TileConverter.h"
#include "TileTreeDiscovery.h"
#include "core/Errors.h"
#include "core/Logging/Logging.h"
#include "services/ConversionLedger/ConversionLedger.h"

namespace fs = std::filesystem;

namespace LvTiles {

BatchReport convertAllTiles(const CFG& cfg, const PixelSource& source) {
    std::error_code ec;
    if (cfg.InputPath.empty() || !fs::is_directory(cfg.InputPath, ec)) {
        throw FatalConfigurationError("Input folder not found or not a directory: " + cfg.InputPath.string());
    }
    if (cfg.OutputPath.empty()) {
        throw FatalConfigurationError("No output folder given");
    }

    fs::create_directories(cfg.OutputPath, ec);
    if (ec) {
        throw FatalConfigurationError("Cannot create output folder " + cfg.OutputPath.string() + ": " + ec.message());
    }

    Log(MESSAGE, "Core", "Converting tiles from {} into {}", cfg.InputPath.string(), cfg.OutputPath.string());

    TileTreeDiscovery discovery(cfg.InputPath, cfg.OutputPath, source.fileExtension());
    ConversionPlanner::Plan plan = ConversionPlanner::plan(discovery, cfg.Force);

    TileConverter converter(source, cfg.ExpectedTileSize);
    BatchScheduler scheduler(converter);
    BatchReport report = scheduler.run(plan.tasks, cfg.Jobs);
    report.skipped = plan.skipped;

    if (!cfg.ReportPath.empty()) {
        ConversionLedger ledger(cfg.ReportPath);
        if (ledger.isOpen()) {
            ledger.recordBatch(report, cfg.Jobs, cfg.Force);
            Log(DEBUG, "Core", "Wrote batch report to {}", cfg.ReportPath);
        }
    }

    Log(MESSAGE, "Core", "Done: {} converted, {} failed, {} skipped",
        report.converted(), report.failed(), report.skipped);
    return report;
}

} // namespace LvTiles
