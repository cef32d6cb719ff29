#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <unistd.h>

#include "plugins/PNG/PNG.h"
#include "plugins/PixelSource.h"

namespace fs = std::filesystem;

namespace LvTiles::test {

/// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("lvtiles_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline DecodedImage makeImage(uint16_t width, uint16_t height, uint8_t r, uint8_t g, uint8_t b) {
    DecodedImage image;
    image.width = width;
    image.height = height;
    image.pixels.reserve(image.pixelCount() * 3);
    for (size_t i = 0; i < image.pixelCount(); ++i) {
        image.pixels.push_back(r);
        image.pixels.push_back(g);
        image.pixels.push_back(b);
    }
    return image;
}

inline void writePng(const fs::path& path, const DecodedImage& image) {
    fs::create_directories(path.parent_path());
    std::string error;
    ASSERT_TRUE(PNGPixelSource::save(path.string(), image, error)) << error;
}

inline void writeBytes(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::vector<uint8_t> readBytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace LvTiles::test
