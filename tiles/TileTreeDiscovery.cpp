#include "TileTreeDiscovery.h"

#include <algorithm>
#include <cctype>

#include "TileNameNormalizer.h"
#include "core/Errors.h"
#include "core/Logging/Logging.h"

namespace fs = std::filesystem;

namespace LvTiles {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

TileTreeDiscovery::TileTreeDiscovery(fs::path inputRoot, fs::path outputRoot, std::string imageExtension)
    : inputRoot_(std::move(inputRoot)), outputRoot_(std::move(outputRoot)),
      imageExtension_(toLower(std::move(imageExtension))) {}

bool TileTreeDiscovery::isNumericSegment(const std::string& name) {
    return !name.empty() &&
           std::all_of(name.begin(), name.end(), [](unsigned char c) { return c >= '0' && c <= '9'; });
}

bool TileTreeDiscovery::hasImageExtension(const std::string& filename) const {
    if (filename.size() < imageExtension_.size()) {
        return false;
    }
    return toLower(filename.substr(filename.size() - imageExtension_.size())) == imageExtension_;
}

std::vector<fs::directory_entry> TileTreeDiscovery::listSorted(const fs::path& dir) const {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        Log(ERROR, "Discovery", "Cannot list {}: {}", dir.string(), ec.message());
        entries.clear();
        return entries;
    }

    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
        return a.path().filename().string() < b.path().filename().string();
    });
    return entries;
}

void TileTreeDiscovery::forEach(const Visitor& visitor) const {
    std::error_code ec;
    if (!fs::is_directory(inputRoot_, ec)) {
        throw FatalConfigurationError("Input folder not found or not a directory: " + inputRoot_.string());
    }

    for (const auto& zoomEntry : listSorted(inputRoot_)) {
        const std::string zoom = zoomEntry.path().filename().string();
        if (!zoomEntry.is_directory(ec) || !isNumericSegment(zoom)) {
            Log(DEBUG, "Discovery", "Ignoring {} (not a zoom level)", zoomEntry.path().string());
            continue;
        }

        for (const auto& xEntry : listSorted(zoomEntry.path())) {
            const std::string x = xEntry.path().filename().string();
            if (!xEntry.is_directory(ec) || !isNumericSegment(x)) {
                Log(DEBUG, "Discovery", "Ignoring {} (not an x column)", xEntry.path().string());
                continue;
            }

            for (const auto& yEntry : listSorted(xEntry.path())) {
                const std::string yFile = yEntry.path().filename().string();
                if (!hasImageExtension(yFile) || !yEntry.is_regular_file(ec)) {
                    continue;
                }

                TileTask task;
                task.sourcePath = yEntry.path();
                task.destPath = outputRoot_ / zoom / x / (TileNameNormalizer::normalize(yFile) + ".bin");
                visitor(task);
            }
        }
    }
}

std::vector<TileTask> TileTreeDiscovery::collect() const {
    std::vector<TileTask> tasks;
    forEach([&tasks](const TileTask& task) { tasks.push_back(task); });
    return tasks;
}

} // namespace LvTiles
