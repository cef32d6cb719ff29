#include "TileConverter.h"

#include <atomic>
#include <cerrno>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

#include "core/Logging/Logging.h"
#include "plugins/LVBIN/LVBIN.h"

namespace fs = std::filesystem;

namespace LvTiles {

namespace {

std::atomic<uint64_t> partialCounter{0};

// Two sources can normalize to the same tile, so every write gets its own scratch file
fs::path partialPathFor(const fs::path& dest) {
    fs::path partial = dest;
    partial += std::format(".{}.{}.part", ::getpid(), partialCounter.fetch_add(1));
    return partial;
}

} // namespace

TileConverter::TileConverter(const PixelSource& source, int expectedTileSize)
    : source_(source), expectedTileSize_(expectedTileSize) {}

ConversionOutcome TileConverter::convert(const TileTask& task) const {
    ConversionOutcome outcome;
    outcome.task = task;

    DecodedImage image;
    std::string error;
    try {
        if (!source_.decode(task.sourcePath.string(), image, error)) {
            outcome.status = ConversionStatus::DecodeFailed;
            outcome.reason = error;
            return outcome;
        }
    } catch (const std::exception& e) {
        outcome.status = ConversionStatus::DecodeFailed;
        outcome.reason = e.what();
        return outcome;
    }

    outcome.width = image.width;
    outcome.height = image.height;

    if (expectedTileSize_ > 0 &&
        (image.width != expectedTileSize_ || image.height != expectedTileSize_)) {
        Log(WARNING, "Converter", "{} is {}x{}, map runtime expects {}x{} tiles",
            task.sourcePath.string(), image.width, image.height, expectedTileSize_, expectedTileSize_);
    }

    try {
        std::vector<uint8_t> bytes = LVBIN::encode(image);
        writeTile(task, bytes, outcome);
    } catch (const std::exception& e) {
        outcome.status = ConversionStatus::EncodeFailed;
        outcome.reason = e.what();
    }

    return outcome;
}

void TileConverter::writeTile(const TileTask& task, const std::vector<uint8_t>& bytes,
                              ConversionOutcome& outcome) const {
    const fs::path& dest = task.destPath;

    if (dest.has_parent_path()) {
        fs::create_directories(dest.parent_path());
    }

    if (fs::is_directory(dest)) {
        Log(WARNING, "Converter", "Removing directory in place of tile: {}", dest.string());
        // Only an empty directory is removed; anything else is left for the user
        if (!fs::remove(dest)) {
            throw std::runtime_error("directory vanished while removing: " + dest.string());
        }
        outcome.pathCollisionRecovered = true;
    }

    // Write beside the destination and rename, so a failed write never leaves a truncated tile
    fs::path partial = partialPathFor(dest);
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::system_error(errno, std::generic_category(), "cannot create " + partial.string());
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (out.fail()) {
            std::error_code ignored;
            fs::remove(partial, ignored);
            throw std::runtime_error("failed to write " + partial.string());
        }
    }

    std::error_code ec;
    fs::rename(partial, dest, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(partial, ignored);
        throw fs::filesystem_error("cannot move tile into place", partial, dest, ec);
    }
}

} // namespace LvTiles
