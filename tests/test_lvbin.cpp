#include <gtest/gtest.h>

#include <random>

#include "plugins/LVBIN/LVBIN.h"
#include "test_helpers.hpp"

using namespace LvTiles;
using namespace LvTiles::test;

// ============================================================================
// RGB565 packing
// ============================================================================

TEST(Rgb565, BlackAndWhite) {
    EXPECT_EQ(toRgb565(0, 0, 0), 0x0000);
    EXPECT_EQ(toRgb565(255, 255, 255), 0xFFFF);
}

TEST(Rgb565, PrimaryColors) {
    EXPECT_EQ(toRgb565(255, 0, 0), 0xF800);
    EXPECT_EQ(toRgb565(0, 255, 0), 0x07E0);
    EXPECT_EQ(toRgb565(0, 0, 255), 0x001F);
}

TEST(Rgb565, TruncatesLowBits) {
    // 0x07 in red/blue and 0x03 in green are below the kept precision
    EXPECT_EQ(toRgb565(0x07, 0x03, 0x07), 0x0000);
    EXPECT_EQ(toRgb565(0x0F, 0x07, 0x0F), (0x01 << 11) | (0x01 << 5) | 0x01);
    EXPECT_EQ(toRgb565(0xFF, 0x00, 0x00), toRgb565(0xF8, 0x00, 0x00));
}

// ============================================================================
// Encoder
// ============================================================================

TEST(LVBINEncode, RedBlueScenario) {
    DecodedImage image;
    image.width = 2;
    image.height = 1;
    image.pixels = {255, 0, 0, 0, 0, 255};

    std::vector<uint8_t> bytes = LVBIN::encode(image);

    const std::vector<uint8_t> expected = {
        0x19, 0x12, 0x00, 0x00, 0x02, 0x00, 0x01, 0x00, 0x04, 0x00, 0x00, 0x00,
        0x00, 0xF8,
        0x1F, 0x00
    };
    EXPECT_EQ(bytes, expected);
}

TEST(LVBINEncode, SizeAndHeaderFieldsFollowDimensions) {
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> dim(0, 40);
    std::uniform_int_distribution<int> byte(0, 255);

    for (int round = 0; round < 25; ++round) {
        DecodedImage image;
        image.width = static_cast<uint16_t>(dim(rng));
        image.height = static_cast<uint16_t>(dim(rng));
        image.pixels.resize(image.pixelCount() * 3);
        for (auto& v : image.pixels) {
            v = static_cast<uint8_t>(byte(rng));
        }

        std::vector<uint8_t> bytes = LVBIN::encode(image);
        ASSERT_EQ(bytes.size(), 12u + image.pixelCount() * 2);

        auto header = LVBIN::readHeader(bytes);
        ASSERT_TRUE(header.has_value());
        EXPECT_EQ(header->width, image.width);
        EXPECT_EQ(header->height, image.height);
        EXPECT_EQ(header->stride, image.width * 2);
        EXPECT_EQ(header->flags, 0);
        EXPECT_EQ(header->reserved, 0);
    }
}

TEST(LVBINEncode, BodyIsRowMajorLittleEndian) {
    DecodedImage image;
    image.width = 2;
    image.height = 2;
    image.pixels = {
        255, 0, 0,     0, 255, 0,
        0, 0, 255,     255, 255, 255
    };

    std::vector<uint8_t> bytes = LVBIN::encode(image);
    ASSERT_EQ(bytes.size(), 20u);

    auto pixelAt = [&bytes](size_t i) {
        return static_cast<uint16_t>(bytes[12 + i * 2] | (bytes[13 + i * 2] << 8));
    };
    EXPECT_EQ(pixelAt(0), 0xF800);
    EXPECT_EQ(pixelAt(1), 0x07E0);
    EXPECT_EQ(pixelAt(2), 0x001F);
    EXPECT_EQ(pixelAt(3), 0xFFFF);
}

TEST(LVBINEncode, EmptyImageIsHeaderOnly) {
    DecodedImage image;
    std::vector<uint8_t> bytes = LVBIN::encode(image);
    ASSERT_EQ(bytes.size(), 12u);
    EXPECT_EQ(bytes[0], 0x19);
    EXPECT_EQ(bytes[1], 0x12);
}

TEST(LVBINEncode, RejectsMismatchedBuffer) {
    DecodedImage image;
    image.width = 4;
    image.height = 4;
    image.pixels.resize(10);
    EXPECT_THROW(LVBIN::encode(image), std::invalid_argument);
}

TEST(LVBINHeader, StrideIsComputedFromBitDepth) {
    LVBINHeader header;
    EXPECT_TRUE(header.setDimensions(256, 256));
    EXPECT_EQ(header.stride, 512);
    EXPECT_EQ(header.bodySize(), 256u * 256u * 2u);
}

TEST(LVBINHeader, StrideMustFitSixteenBits) {
    LVBINHeader header;
    EXPECT_TRUE(header.setDimensions(32767, 1));
    EXPECT_EQ(header.stride, 65534);

    EXPECT_FALSE(header.setDimensions(32768, 1));
    EXPECT_FALSE(header.setDimensions(40000, 2));
    EXPECT_FALSE(header.setDimensions(65535, 1));
    EXPECT_EQ(header.width, 32767);
    EXPECT_EQ(header.stride, 65534);
}

TEST(LVBINEncode, RejectsRowsWiderThanStrideField) {
    DecodedImage image = makeImage(32768, 1, 1, 2, 3);
    EXPECT_THROW(LVBIN::encode(image), std::invalid_argument);

    DecodedImage widest = makeImage(32767, 1, 1, 2, 3);
    std::vector<uint8_t> bytes = LVBIN::encode(widest);
    ASSERT_EQ(bytes.size(), 12u + 32767u * 2u);
    auto header = LVBIN::readHeader(bytes);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->stride, 65534);
}

TEST(LVBINHeader, ReadRejectsWrappedStride) {
    // width 32768 with the stride field wrapped to 0
    const std::vector<uint8_t> bytes = {
        0x19, 0x12, 0x00, 0x00, 0x00, 0x80, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00
    };
    EXPECT_FALSE(LVBIN::readHeader(bytes).has_value());
}

TEST(LVBINHeader, ReadRejectsBadInput) {
    EXPECT_FALSE(LVBIN::readHeader({0x19, 0x12, 0x00}).has_value());

    std::vector<uint8_t> bytes = LVBIN::encode(makeImage(3, 1, 1, 2, 3));
    std::vector<uint8_t> badMagic = bytes;
    badMagic[0] = 0x18;
    EXPECT_FALSE(LVBIN::readHeader(badMagic).has_value());

    std::vector<uint8_t> badFormat = bytes;
    badFormat[1] = 0x0F;
    EXPECT_FALSE(LVBIN::readHeader(badFormat).has_value());

    std::vector<uint8_t> badStride = bytes;
    badStride[8] = 0x05;
    EXPECT_FALSE(LVBIN::readHeader(badStride).has_value());
}
