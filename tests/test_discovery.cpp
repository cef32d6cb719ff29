#include <gtest/gtest.h>

#include <algorithm>

#include "core/Errors.h"
#include "tiles/ConversionPlanner.h"
#include "tiles/TileTreeDiscovery.h"
#include "test_helpers.hpp"

using namespace LvTiles;
using namespace LvTiles::test;

class DiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        input = tmp.path() / "input";
        output = tmp.path() / "output";
        fs::create_directories(input);
    }

    void touch(const fs::path& relative) {
        writeBytes(input / relative, "x");
    }

    TempDir tmp;
    fs::path input;
    fs::path output;
};

TEST_F(DiscoveryTest, MapsSourcesToNormalizedBinPaths) {
    touch("3/4/5.png");
    touch("3/4/6.PNG");

    auto tasks = TileTreeDiscovery(input, output).collect();
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].sourcePath.string(), (input / "3" / "4" / "5.png").string());
    EXPECT_EQ(tasks[0].destPath.string(), (output / "3" / "4" / "5.bin").string());
    EXPECT_EQ(tasks[1].sourcePath.string(), (input / "3" / "4" / "6.PNG").string());
    EXPECT_EQ(tasks[1].destPath.string(), (output / "3" / "4" / "6.bin").string());
}

TEST_F(DiscoveryTest, SortedDirectoryThenFileOrder) {
    touch("2/1/1.png");
    touch("10/0/0.png");
    touch("1/5/b.png");
    touch("1/5/a.png");
    touch("1/10/z.png");

    auto tasks = TileTreeDiscovery(input, output).collect();
    std::vector<std::string> sources;
    for (const auto& t : tasks) {
        sources.push_back(t.sourcePath.lexically_relative(input).generic_string());
    }

    // Byte-wise name order at every level
    const std::vector<std::string> expected = {
        "1/10/z.png", "1/5/a.png", "1/5/b.png", "10/0/0.png", "2/1/1.png"
    };
    EXPECT_EQ(sources, expected);
}

TEST_F(DiscoveryTest, SkipsNonNumericZoomAndXDirectories) {
    touch("3/4/5.png");
    touch("abc/4/5.png");
    touch("3a/4/5.png");
    touch("3/x1/5.png");
    touch("3/-1/5.png");

    auto tasks = TileTreeDiscovery(input, output).collect();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].sourcePath.string(), (input / "3" / "4" / "5.png").string());
}

TEST_F(DiscoveryTest, IgnoresFilesAtDirectoryLevelsAndOtherExtensions) {
    touch("7.png");
    touch("3/8.png");
    touch("3/4/readme.txt");
    touch("3/4/5.png.bak");
    touch("3/4/5.jpg");
    touch("3/4/5.png");
    fs::create_directories(input / "3" / "4" / "dir.png");

    auto tasks = TileTreeDiscovery(input, output).collect();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].destPath.string(), (output / "3" / "4" / "5.bin").string());
}

TEST_F(DiscoveryTest, ChainedExtensionsCollapse) {
    touch("0/0/tile.bin.png");
    auto tasks = TileTreeDiscovery(input, output).collect();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].destPath.string(), (output / "0" / "0" / "tile.bin").string());
}

TEST_F(DiscoveryTest, RestartableWalkSeesNewFiles) {
    TileTreeDiscovery discovery(input, output);
    touch("1/1/1.png");
    EXPECT_EQ(discovery.collect().size(), 1u);
    touch("1/1/2.png");
    EXPECT_EQ(discovery.collect().size(), 2u);
    EXPECT_TRUE(discovery.collect() == discovery.collect());
}

TEST_F(DiscoveryTest, MissingInputRootIsFatal) {
    TileTreeDiscovery discovery(tmp.path() / "missing", output);
    EXPECT_THROW(discovery.collect(), FatalConfigurationError);

    writeBytes(tmp.path() / "file", "x");
    TileTreeDiscovery onFile(tmp.path() / "file", output);
    EXPECT_THROW(onFile.collect(), FatalConfigurationError);
}

TEST(TileTreeDiscoveryStatic, NumericSegments) {
    EXPECT_TRUE(TileTreeDiscovery::isNumericSegment("0"));
    EXPECT_TRUE(TileTreeDiscovery::isNumericSegment("0012"));
    EXPECT_FALSE(TileTreeDiscovery::isNumericSegment(""));
    EXPECT_FALSE(TileTreeDiscovery::isNumericSegment("1.5"));
    EXPECT_FALSE(TileTreeDiscovery::isNumericSegment(" 1"));
    EXPECT_FALSE(TileTreeDiscovery::isNumericSegment("+1"));
}

// ============================================================================
// Planner
// ============================================================================

TEST_F(DiscoveryTest, PlannerSkipsExistingOutputsUnlessForced) {
    touch("1/2/3.png");
    touch("1/2/4.png");
    writeBytes(output / "1" / "2" / "3.bin", "old");

    TileTreeDiscovery discovery(input, output);

    auto plan = ConversionPlanner::plan(discovery, false);
    ASSERT_EQ(plan.tasks.size(), 1u);
    EXPECT_EQ(plan.tasks[0].destPath.string(), (output / "1" / "2" / "4.bin").string());
    EXPECT_EQ(plan.skipped, 1u);

    auto forced = ConversionPlanner::plan(discovery, true);
    EXPECT_EQ(forced.tasks.size(), 2u);
    EXPECT_EQ(forced.skipped, 0u);
}

TEST_F(DiscoveryTest, PlannerDoesNotSkipDirectoryInPlaceOfOutput) {
    touch("1/2/3.png");
    fs::create_directories(output / "1" / "2" / "3.bin");

    auto plan = ConversionPlanner::plan(TileTreeDiscovery(input, output), false);
    EXPECT_EQ(plan.tasks.size(), 1u);
}

TEST_F(DiscoveryTest, PlannerCreatesNothing) {
    touch("1/2/3.png");
    auto plan = ConversionPlanner::plan(TileTreeDiscovery(input, output).collect(), false);
    EXPECT_EQ(plan.tasks.size(), 1u);
    EXPECT_FALSE(fs::exists(output));
}
