#include "PNG.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <limits>
#include <memory>
#include <vector>

#include <png.h>

#include "core/Logging/Logging.h"

namespace LvTiles {

namespace {

// Everything touched after setjmp lives here, behind a pointer that is never
// reassigned, so its contents stay well defined after a longjmp.
struct PNGReadContext {
    FILE* file = nullptr;
    png_structp png_ptr = nullptr;
    png_infop info_ptr = nullptr;
    std::vector<uint8_t> rgb;
    std::vector<png_bytep> rowPointers;
    std::string error;

    ~PNGReadContext() {
        if (png_ptr) {
            png_destroy_read_struct(&png_ptr, info_ptr ? &info_ptr : nullptr, nullptr);
        }
        if (file) {
            fclose(file);
        }
    }
};

struct PNGWriteContext {
    FILE* file = nullptr;
    png_structp png_ptr = nullptr;
    png_infop info_ptr = nullptr;
    std::string error;

    ~PNGWriteContext() {
        if (png_ptr) {
            png_destroy_write_struct(&png_ptr, info_ptr ? &info_ptr : nullptr);
        }
        if (file) {
            fclose(file);
        }
    }
};

template<typename Context>
void onPngError(png_structp png_ptr, png_const_charp message) {
    auto* ctx = static_cast<Context*>(png_get_error_ptr(png_ptr));
    if (ctx) {
        ctx->error = message ? message : "unknown libpng error";
    }
    png_longjmp(png_ptr, 1);
}

void onPngWarning(png_structp, png_const_charp message) {
    Log(DEBUG, "PNG", "libpng warning: {}", message ? message : "");
}

} // namespace

bool PNGPixelSource::decode(const std::string& path, DecodedImage& image, std::string& error) const {
    auto ctx = std::make_unique<PNGReadContext>();

    ctx->file = fopen(path.c_str(), "rb");
    if (!ctx->file) {
        error = std::string("cannot open file: ") + std::strerror(errno);
        return false;
    }

    uint8_t signature[8];
    if (fread(signature, 1, sizeof(signature), ctx->file) != sizeof(signature)) {
        error = "file too short for a PNG signature";
        return false;
    }
    if (png_sig_cmp(signature, 0, sizeof(signature))) {
        error = "not a PNG file";
        return false;
    }

    ctx->png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, ctx.get(),
                                          onPngError<PNGReadContext>, onPngWarning);
    if (!ctx->png_ptr) {
        error = "png_create_read_struct failed";
        return false;
    }

    ctx->info_ptr = png_create_info_struct(ctx->png_ptr);
    if (!ctx->info_ptr) {
        error = "png_create_info_struct failed";
        return false;
    }

    if (setjmp(png_jmpbuf(ctx->png_ptr))) {
        error = ctx->error.empty() ? "corrupt PNG data" : ctx->error;
        return false;
    }

    png_init_io(ctx->png_ptr, ctx->file);
    png_set_sig_bytes(ctx->png_ptr, sizeof(signature));
    png_read_info(ctx->png_ptr, ctx->info_ptr);

    png_uint_32 width = png_get_image_width(ctx->png_ptr, ctx->info_ptr);
    png_uint_32 height = png_get_image_height(ctx->png_ptr, ctx->info_ptr);
    png_byte color_type = png_get_color_type(ctx->png_ptr, ctx->info_ptr);
    png_byte bit_depth = png_get_bit_depth(ctx->png_ptr, ctx->info_ptr);

    if (width > std::numeric_limits<uint16_t>::max() || height > std::numeric_limits<uint16_t>::max()) {
        error = std::format("image too large for a 16-bit header: {}x{}", width, height);
        return false;
    }

    // Normalize everything to 8-bit RGB
    if (bit_depth == 16) {
        png_set_strip_16(ctx->png_ptr);
    }
    if (color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_palette_to_rgb(ctx->png_ptr);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
        png_set_expand_gray_1_2_4_to_8(ctx->png_ptr);
    }
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
        png_set_gray_to_rgb(ctx->png_ptr);
    }
    if (png_get_valid(ctx->png_ptr, ctx->info_ptr, PNG_INFO_tRNS)) {
        png_set_tRNS_to_alpha(ctx->png_ptr);
    }
    png_set_strip_alpha(ctx->png_ptr);
    png_set_interlace_handling(ctx->png_ptr);

    png_read_update_info(ctx->png_ptr, ctx->info_ptr);

    if (png_get_channels(ctx->png_ptr, ctx->info_ptr) != 3 ||
        png_get_bit_depth(ctx->png_ptr, ctx->info_ptr) != 8) {
        error = "unsupported PNG pixel layout after expansion";
        return false;
    }

    size_t rowBytes = png_get_rowbytes(ctx->png_ptr, ctx->info_ptr);
    ctx->rgb.resize(rowBytes * height);
    ctx->rowPointers.resize(height);
    for (png_uint_32 y = 0; y < height; y++) {
        ctx->rowPointers[y] = ctx->rgb.data() + y * rowBytes;
    }

    png_read_image(ctx->png_ptr, ctx->rowPointers.data());
    png_read_end(ctx->png_ptr, nullptr);

    image.width = static_cast<uint16_t>(width);
    image.height = static_cast<uint16_t>(height);
    image.pixels = std::move(ctx->rgb);

    Log(DEBUG, "PNG", "Decoded {}x{} from {}", width, height, path);
    return true;
}

bool PNGPixelSource::save(const std::string& path, const DecodedImage& image, std::string& error) {
    // libpng refuses to write 0x0 images
    if (image.width == 0 || image.height == 0) {
        error = std::format("invalid image dimensions for saving: {}x{}", image.width, image.height);
        return false;
    }
    if (!image.isValid()) {
        error = std::format("pixel data size mismatch: expected {}, got {}",
                            image.pixelCount() * 3, image.pixels.size());
        return false;
    }

    auto ctx = std::make_unique<PNGWriteContext>();

    ctx->file = fopen(path.c_str(), "wb");
    if (!ctx->file) {
        error = std::string("cannot create file: ") + std::strerror(errno);
        return false;
    }

    ctx->png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, ctx.get(),
                                           onPngError<PNGWriteContext>, onPngWarning);
    if (!ctx->png_ptr) {
        error = "png_create_write_struct failed";
        return false;
    }

    ctx->info_ptr = png_create_info_struct(ctx->png_ptr);
    if (!ctx->info_ptr) {
        error = "png_create_info_struct failed";
        return false;
    }

    if (setjmp(png_jmpbuf(ctx->png_ptr))) {
        error = ctx->error.empty() ? "PNG write failed" : ctx->error;
        return false;
    }

    png_init_io(ctx->png_ptr, ctx->file);
    png_set_IHDR(ctx->png_ptr, ctx->info_ptr, image.width, image.height, 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(ctx->png_ptr, ctx->info_ptr);

    const size_t rowBytes = static_cast<size_t>(image.width) * 3;
    for (uint16_t y = 0; y < image.height; y++) {
        png_write_row(ctx->png_ptr, const_cast<png_bytep>(image.pixels.data() + y * rowBytes));
    }

    png_write_end(ctx->png_ptr, nullptr);
    return true;
}

} // namespace LvTiles
