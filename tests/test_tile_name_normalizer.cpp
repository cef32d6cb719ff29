#include <gtest/gtest.h>

#include "tiles/TileNameNormalizer.h"

using namespace LvTiles;

TEST(TileNameNormalizer, StripsSingleKnownExtension) {
    EXPECT_EQ(TileNameNormalizer::normalize("tile.png"), "tile");
    EXPECT_EQ(TileNameNormalizer::normalize("12.jpg"), "12");
    EXPECT_EQ(TileNameNormalizer::normalize("12.jpeg"), "12");
    EXPECT_EQ(TileNameNormalizer::normalize("12.bin"), "12");
}

TEST(TileNameNormalizer, StripsChainedExtensionsAnyCase) {
    EXPECT_EQ(TileNameNormalizer::normalize("tile.PNG.bin"), "tile");
    EXPECT_EQ(TileNameNormalizer::normalize("tile.png.JPEG.bin.png"), "tile");
}

TEST(TileNameNormalizer, StopsAtUnknownExtension) {
    EXPECT_EQ(TileNameNormalizer::normalize("tile.data"), "tile.data");
    EXPECT_EQ(TileNameNormalizer::normalize("tile.data.png"), "tile.data");
    EXPECT_EQ(TileNameNormalizer::normalize("tile.png.data"), "tile.png.data");
}

TEST(TileNameNormalizer, NamesWithoutExtension) {
    EXPECT_EQ(TileNameNormalizer::normalize("tile"), "tile");
    EXPECT_EQ(TileNameNormalizer::normalize("tile."), "tile.");
    EXPECT_EQ(TileNameNormalizer::normalize(""), "");
}

TEST(TileNameNormalizer, LeadingDotsAreNotExtensions) {
    EXPECT_EQ(TileNameNormalizer::normalize(".png"), ".png");
    EXPECT_EQ(TileNameNormalizer::normalize("..png"), "..png");
    EXPECT_EQ(TileNameNormalizer::normalize(".hidden.png"), ".hidden");
}

TEST(TileNameNormalizer, Idempotent) {
    for (const char* name : {"tile.png", "tile.PNG.bin", "tile.data", ".png", "a.b.c.jpg", "x.bin.bin"}) {
        std::string once = TileNameNormalizer::normalize(name);
        EXPECT_EQ(TileNameNormalizer::normalize(once), once) << name;
    }
}
