#ifndef LVTILES_CFG_H
#define LVTILES_CFG_H

#pragma once

#include <filesystem>
#include <string>

namespace LvTiles {

class ConfigParser;

/**
 * @brief Run configuration, built once in main() and passed by const reference.
 *
 * Values come from defaults, then an optional .cfg file, then command line
 * overrides (main() writes those into the same ConfigParser before calling
 * fromParser()).
 */
class CFG {
public:
    std::string configFilePath;

    std::filesystem::path InputPath;
    std::filesystem::path OutputPath;
    int Jobs;
    bool Force;
    bool Logging;
    std::string LogFile;
    std::string ReportPath;
    // 0 disables the tile size check
    int ExpectedTileSize;

    CFG();

    // Throws FatalConfigurationError on malformed numeric or boolean values
    static CFG fromParser(const ConfigParser& config);

    static int defaultJobs();

private:
    static bool parseBool(const std::string& key, const std::string& value);
    static int parseInt(const std::string& key, const std::string& value);
};

} // namespace LvTiles

#endif // LVTILES_CFG_H
