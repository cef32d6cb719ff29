#include "LVBIN.h"

#include <format>
#include <stdexcept>

#include "core/Logging/Logging.h"

namespace LvTiles {

namespace {

void putU16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>(value >> 8));
}

uint16_t getU16(const std::vector<uint8_t>& data, size_t offset) {
    return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

} // namespace

void LVBIN::writeHeader(const LVBINHeader& header, std::vector<uint8_t>& out) {
    out.push_back(header.magic);
    out.push_back(header.colorFormat);
    putU16(out, header.flags);
    putU16(out, header.width);
    putU16(out, header.height);
    putU16(out, header.stride);
    putU16(out, header.reserved);
}

std::vector<uint8_t> LVBIN::encode(const DecodedImage& image) {
    if (!image.isValid()) {
        throw std::invalid_argument(std::format(
            "pixel buffer holds {} bytes, expected {} for {}x{}",
            image.pixels.size(), image.pixelCount() * 3, image.width, image.height));
    }

    LVBINHeader header;
    if (!header.setDimensions(image.width, image.height)) {
        throw std::invalid_argument(std::format(
            "width {} needs a stride of {} bytes, the header holds at most {}",
            image.width, rowStride(header.colorFormat, image.width), LVBIN_MAX_STRIDE));
    }

    std::vector<uint8_t> out;
    out.reserve(LVBIN_HEADER_SIZE + header.bodySize());
    writeHeader(header, out);

    const uint8_t* px = image.pixels.data();
    for (size_t i = 0; i < image.pixelCount(); ++i, px += 3) {
        putU16(out, toRgb565(px[0], px[1], px[2]));
    }

    return out;
}

std::optional<LVBINHeader> LVBIN::readHeader(const std::vector<uint8_t>& data) {
    if (data.size() < LVBIN_HEADER_SIZE) {
        Log(DEBUG, "LVBIN", "Buffer too small for header: {} bytes", data.size());
        return std::nullopt;
    }

    LVBINHeader header;
    header.magic = data[0];
    header.colorFormat = data[1];
    header.flags = getU16(data, 2);
    header.width = getU16(data, 4);
    header.height = getU16(data, 6);
    header.stride = getU16(data, 8);
    header.reserved = getU16(data, 10);

    if (header.magic != LVBIN_MAGIC) {
        Log(DEBUG, "LVBIN", "Bad magic 0x{:02x}", header.magic);
        return std::nullopt;
    }
    if (bitsPerPixel(header.colorFormat) == 0) {
        Log(DEBUG, "LVBIN", "Unsupported color format 0x{:02x}", header.colorFormat);
        return std::nullopt;
    }

    if (static_cast<uint32_t>(header.stride) != rowStride(header.colorFormat, header.width)) {
        Log(DEBUG, "LVBIN", "Stride {} does not match width {}", header.stride, header.width);
        return std::nullopt;
    }

    return header;
}

} // namespace LvTiles
