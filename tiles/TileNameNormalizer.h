#pragma once

#include <string>

namespace LvTiles {

/**
 * @brief Derives the output base name of a tile file.
 *
 * Strips trailing extensions for as long as they are png, bin, jpg or jpeg
 * (any case): "12.png" -> "12", "12.PNG.bin" -> "12", "12.data" is kept.
 * A name made only of leading dots plus a suffix (".png") has no extension.
 * Applying it to its own output changes nothing.
 */
class TileNameNormalizer {
public:
    static std::string normalize(const std::string& filename);

    static bool isKnownExtension(const std::string& extension);
};

} // namespace LvTiles
