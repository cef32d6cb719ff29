#include "CFG.h"

#include <algorithm>
#include <cctype>
#include <format>
#include <thread>

#include "ConfigParser.h"
#include "Errors.h"
#include "Logging/Logging.h"

namespace LvTiles {

CFG::CFG()
    : Jobs(defaultJobs()), Force(false), Logging(true), ExpectedTileSize(256) {}

int CFG::defaultJobs() {
    unsigned int hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : static_cast<int>(hw);
}

CFG CFG::fromParser(const ConfigParser& config) {
    CFG cfg;

    cfg.InputPath = config.get("InputPath", "");
    cfg.OutputPath = config.get("OutputPath", "");

    if (config.hasKey("Jobs")) {
        cfg.Jobs = parseInt("Jobs", config.get("Jobs"));
    }
    if (cfg.Jobs < 1) {
        Log(WARNING, "Config", "Jobs must be at least 1 (got {}), using 1", cfg.Jobs);
        cfg.Jobs = 1;
    }

    cfg.Force = parseBool("Force", config.get("Force", "0"));
    cfg.Logging = parseBool("Logging", config.get("Logging", "1"));
    cfg.LogFile = config.get("LogFile", "");
    cfg.ReportPath = config.get("ReportPath", "");

    cfg.ExpectedTileSize = parseInt("ExpectedTileSize", config.get("ExpectedTileSize", "256"));
    if (cfg.ExpectedTileSize < 0) {
        throw FatalConfigurationError("ExpectedTileSize must not be negative");
    }

    return cfg;
}

bool CFG::parseBool(const std::string& key, const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off" || lowered.empty()) {
        return false;
    }
    throw FatalConfigurationError(std::format("Invalid boolean for {}: '{}'", key, value));
}

int CFG::parseInt(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw FatalConfigurationError(std::format("Invalid integer for {}: '{}'", key, value));
    }
    if (consumed != value.size()) {
        throw FatalConfigurationError(std::format("Invalid integer for {}: '{}'", key, value));
    }
    return result;
}

} // namespace LvTiles
