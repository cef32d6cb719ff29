#ifndef LVBINV9_H
#define LVBINV9_H

#include <cstddef>
#include <cstdint>

namespace LvTiles {

// LVGL v9 image file (lv_image_header_t followed by raw pixel data)
constexpr uint8_t LVBIN_MAGIC = 0x19;
constexpr uint8_t LVBIN_CF_RGB565 = 0x12;
constexpr size_t LVBIN_HEADER_SIZE = 12;

constexpr uint32_t bitsPerPixel(uint8_t colorFormat) {
    switch (colorFormat) {
        case LVBIN_CF_RGB565: return 16;
        default: return 0;
    }
}

// Bytes per row, unclamped; the header field only holds values up to 0xFFFF
constexpr uint32_t rowStride(uint8_t colorFormat, uint32_t width) {
    return (width * bitsPerPixel(colorFormat) + 7) / 8;
}

constexpr uint32_t LVBIN_MAX_STRIDE = 0xFFFF;

// Top 5 bits of red, top 6 of green, top 5 of blue: RRRRRGGG GGGBBBBB
constexpr uint16_t toRgb565(uint8_t r, uint8_t g, uint8_t b) {
    return static_cast<uint16_t>(((r & 0xF8) << 8) | ((g & 0xFC) << 3) | (b >> 3));
}

struct LVBINHeader {
    uint8_t magic;        // Always 0x19
    uint8_t colorFormat;  // lv_color_format_t
    uint16_t flags;       // Compression / premultiplied bits, unused here
    uint16_t width;       // Image width
    uint16_t height;      // Image height
    uint16_t stride;      // Bytes per row
    uint16_t reserved;    // Always 0

    LVBINHeader() : magic(LVBIN_MAGIC), colorFormat(LVBIN_CF_RGB565), flags(0),
                    width(0), height(0), stride(0), reserved(0) {}

    // Returns false, leaving the header untouched, when the row does not fit the stride field
    bool setDimensions(uint16_t w, uint16_t h) {
        uint32_t rowBytes = rowStride(colorFormat, w);
        if (rowBytes > LVBIN_MAX_STRIDE) {
            return false;
        }
        width = w;
        height = h;
        stride = static_cast<uint16_t>(rowBytes);
        return true;
    }

    size_t bodySize() const {
        return static_cast<size_t>(stride) * height;
    }
};

} // namespace LvTiles

#endif // LVBINV9_H
