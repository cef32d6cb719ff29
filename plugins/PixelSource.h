#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace LvTiles {

/**
 * @brief 8-bit RGB raster, row-major, 3 bytes per pixel.
 */
struct DecodedImage {
    uint16_t width = 0;
    uint16_t height = 0;
    std::vector<uint8_t> pixels;

    size_t pixelCount() const { return static_cast<size_t>(width) * height; }
    bool isValid() const { return pixels.size() == pixelCount() * 3; }
};

/**
 * @brief Decodes a raster file on disk into a DecodedImage.
 *
 * Implementations must be safe to call from several threads at once.
 */
class PixelSource {
public:
    virtual ~PixelSource() = default;

    // On failure returns false and describes the problem in error
    virtual bool decode(const std::string& path, DecodedImage& image, std::string& error) const = 0;

    // Lower-case extension (with dot) of files this source can read
    virtual std::string fileExtension() const = 0;
};

} // namespace LvTiles
