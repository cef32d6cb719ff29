#include <getopt.h>

#include <iostream>
#include <memory>
#include <string>

#include "core/CFG.h"
#include "core/ConfigParser.h"
#include "core/Errors.h"
#include "core/Logging/FileLogWriter.h"
#include "core/Logging/Logging.h"
#include "plugins/PNG/PNG.h"
#include "tiles/ConversionJob.h"

using namespace LvTiles;

static void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " -i <input> -o <output> [options]" << std::endl;
    std::cout << "\nConvert zoom/x/y PNG map tiles into LVGL v9 RGB565 .bin files." << std::endl;
    std::cout << "\nRequired:" << std::endl;
    std::cout << "  -i, --input <dir>     Input root folder containing tiles in zoom/x/y.png structure" << std::endl;
    std::cout << "  -o, --output <dir>    Output root folder where .bin tiles will be written" << std::endl;
    std::cout << "\nOptional:" << std::endl;
    std::cout << "  -j, --jobs <n>        Number of worker threads (default: " << CFG::defaultJobs() << ")" << std::endl;
    std::cout << "  -f, --force           Rebuild even if output file already exists" << std::endl;
    std::cout << "  -c, --config <file>   key = value configuration file, flags override it" << std::endl;
    std::cout << "  -r, --report <file>   Write a JSON Lines record of the batch" << std::endl;
    std::cout << "  -l, --log-file <file> Also write a detailed log to this file" << std::endl;
    std::cout << "  -v, --verbose         Show debug messages" << std::endl;
    std::cout << "  -q, --quiet           Only show warnings and errors" << std::endl;
    std::cout << "  -h, --help            Show this help" << std::endl;
}

int main(int argc, char **argv) {
    static const option longOptions[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"jobs", required_argument, nullptr, 'j'},
        {"force", no_argument, nullptr, 'f'},
        {"config", required_argument, nullptr, 'c'},
        {"report", required_argument, nullptr, 'r'},
        {"log-file", required_argument, nullptr, 'l'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    std::string configFile;
    ConfigParser overrides;
    LogLevel consoleLevel = MESSAGE;

    int opt;
    while ((opt = getopt_long(argc, argv, "i:o:j:fc:r:l:vqh", longOptions, nullptr)) != -1) {
        switch (opt) {
            case 'i': overrides.set("InputPath", optarg); break;
            case 'o': overrides.set("OutputPath", optarg); break;
            case 'j': overrides.set("Jobs", optarg); break;
            case 'f': overrides.set("Force", "1"); break;
            case 'c': configFile = optarg; break;
            case 'r': overrides.set("ReportPath", optarg); break;
            case 'l': overrides.set("LogFile", optarg); break;
            case 'v': consoleLevel = DEBUG; break;
            case 'q': consoleLevel = WARNING; break;
            case 'h':
                printHelp(argv[0]);
                return 0;
            default:
                printHelp(argv[0]);
                return 1;
        }
    }

    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << std::endl;
        printHelp(argv[0]);
        return 1;
    }

    InitializeLogging(consoleLevel);

    int result = 0;
    try {
        ConfigParser values;
        if (!configFile.empty() && !values.loadFromFile(configFile)) {
            throw FatalConfigurationError("Could not load config file: " + configFile);
        }
        for (const auto& [key, value] : overrides.getAllValues()) {
            values.set(key, value);
        }

        CFG cfg = CFG::fromParser(values);
        cfg.configFilePath = configFile;
        if (cfg.InputPath.empty() || cfg.OutputPath.empty()) {
            ShutdownLogging();
            std::cerr << "Both --input and --output are required" << std::endl;
            printHelp(argv[0]);
            return 1;
        }

        if (!cfg.LogFile.empty()) {
            auto fileWriter = std::make_shared<FileLogWriter>(cfg.LogFile, DEBUG);
            if (fileWriter->isOpen()) {
                AddLogWriter(std::move(fileWriter));
            }
        }
        ToggleLogging(cfg.Logging);

        PNGPixelSource pngSource;
        convertAllTiles(cfg, pngSource);
    } catch (const FatalConfigurationError& e) {
        ToggleLogging(true);
        Log(FATAL, "Core", "{}", e.what());
        result = 1;
    } catch (const std::exception& e) {
        ToggleLogging(true);
        Log(FATAL, "Core", "Unexpected error: {}", e.what());
        result = 1;
    }

    ShutdownLogging();
    return result;
}
