#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "LVBINV9.hpp"
#include "plugins/PixelSource.h"

namespace LvTiles {

/**
 * @brief Encoder for LVGL v9 RGB565 .bin tiles.
 *
 * All multi-byte fields are written little-endian byte by byte, so the output
 * does not depend on the host byte order.
 */
class LVBIN {
public:
    // Header followed by width*height RGB565 values, row-major.
    // Throws std::invalid_argument if the pixel buffer does not match the size.
    static std::vector<uint8_t> encode(const DecodedImage& image);

    static void writeHeader(const LVBINHeader& header, std::vector<uint8_t>& out);

    // Parses and sanity checks the first 12 bytes of a tile file
    static std::optional<LVBINHeader> readHeader(const std::vector<uint8_t>& data);
};

} // namespace LvTiles
