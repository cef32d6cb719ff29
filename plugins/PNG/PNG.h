#pragma once

#include <string>

#include "plugins/PixelSource.h"

namespace LvTiles {

/**
 * @brief libpng backed PixelSource.
 *
 * Palette, grayscale and 16-bit images are expanded to 8-bit RGB; any alpha
 * channel is dropped. Images wider or taller than 65535 pixels are rejected.
 */
class PNGPixelSource : public PixelSource {
public:
    PNGPixelSource() = default;
    ~PNGPixelSource() override = default;

    bool decode(const std::string& path, DecodedImage& image, std::string& error) const override;
    std::string fileExtension() const override { return ".png"; }

    // Writes an 8-bit RGB PNG, used for fixtures and round-trip checks
    static bool save(const std::string& path, const DecodedImage& image, std::string& error);
};

} // namespace LvTiles
