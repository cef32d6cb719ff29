#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "TileTypes.h"

namespace LvTiles {

/**
 * @brief Walks <input>/<zoom>/<x>/<y><ext> and maps each tile to
 * <output>/<zoom>/<x>/<normalized y>.bin.
 *
 * Zoom and x directories must have all-digit names, anything else at those
 * levels is skipped. Every level is visited in byte-wise name order, so two
 * walks over the same tree yield the same sequence. Nothing is cached: each
 * forEach() call walks the filesystem again.
 */
class TileTreeDiscovery {
public:
    using Visitor = std::function<void(const TileTask&)>;

    TileTreeDiscovery(std::filesystem::path inputRoot,
                      std::filesystem::path outputRoot,
                      std::string imageExtension = ".png");

    // Throws FatalConfigurationError when the input root is not a directory
    void forEach(const Visitor& visitor) const;

    std::vector<TileTask> collect() const;

    const std::filesystem::path& inputRoot() const { return inputRoot_; }
    const std::filesystem::path& outputRoot() const { return outputRoot_; }

    static bool isNumericSegment(const std::string& name);

private:
    bool hasImageExtension(const std::string& filename) const;
    std::vector<std::filesystem::directory_entry> listSorted(const std::filesystem::path& dir) const;

    std::filesystem::path inputRoot_;
    std::filesystem::path outputRoot_;
    std::string imageExtension_;
};

} // namespace LvTiles
