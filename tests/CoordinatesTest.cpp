#include "core/Coordinates.h"
#include <gtest/gtest.h>
#include <limits>
#include <unordered_set>

using namespace blockworld::core;

TEST(CoordinatesTest, NegativeOneMapsToLastCellOfPreviousChunk) {
    EXPECT_EQ(localCoord(-1), CHUNK_SIZE - 1);
    EXPECT_EQ(chunkCoord(-1), -1);
}

TEST(CoordinatesTest, ChunkBoundaries) {
    EXPECT_EQ(chunkCoord(0), 0);
    EXPECT_EQ(localCoord(0), 0);
    EXPECT_EQ(chunkCoord(15), 0);
    EXPECT_EQ(localCoord(15), 15);
    EXPECT_EQ(chunkCoord(16), 1);
    EXPECT_EQ(localCoord(16), 0);
    EXPECT_EQ(chunkCoord(-16), -1);
    EXPECT_EQ(localCoord(-16), 0);
    EXPECT_EQ(chunkCoord(-17), -2);
    EXPECT_EQ(localCoord(-17), 15);
}

TEST(CoordinatesTest, DecompositionRecombines) {
    for (int x = -1000; x <= 1000; ++x) {
        const int local = localCoord(x);
        ASSERT_GE(local, 0);
        ASSERT_LT(local, CHUNK_SIZE);
        ASSERT_EQ(chunkOrigin(chunkCoord(x)) + local, x) << "x = " << x;
    }
}

TEST(CoordinatesTest, DecompositionAtIntegerLimits) {
    const int extremes[] = {
        std::numeric_limits<int>::min(),
        std::numeric_limits<int>::min() + 1,
        std::numeric_limits<int>::max(),
        std::numeric_limits<int>::max() - 1,
    };

    for (int x : extremes) {
        EXPECT_EQ(chunkOrigin(chunkCoord(x)) + localCoord(x), static_cast<int64_t>(x)) << "x = " << x;
    }
}

TEST(CoordinatesTest, BlockIndexLayout) {
    EXPECT_EQ(blockIndex(0, 0, 0), 0u);
    EXPECT_EQ(blockIndex(1, 0, 0), 1u);
    EXPECT_EQ(blockIndex(0, 0, 1), static_cast<std::size_t>(CHUNK_SIZE));
    EXPECT_EQ(blockIndex(0, 1, 0), static_cast<std::size_t>(CHUNK_SIZE * CHUNK_SIZE));
    EXPECT_EQ(blockIndex(15, 31, 15), chunkVolume(32) - 1);
}

TEST(CoordinatesTest, ChunkCoordHashDistinguishesSwappedPairs) {
    std::unordered_set<ChunkCoord, ChunkCoord::Hash> coords;
    coords.insert(ChunkCoord(1, 2));
    coords.insert(ChunkCoord(2, 1));
    coords.insert(ChunkCoord(-1, 2));
    coords.insert(ChunkCoord(1, 2));

    EXPECT_EQ(coords.size(), 3u);
    EXPECT_NE(ChunkCoord(1, 2), ChunkCoord(2, 1));
    EXPECT_EQ(chunkCoordOf(-1, 17), ChunkCoord(-1, 1));
}
