#include "core/BlockRegistry.h"
#include "core/World.h"
#include "core/WorldSnapshot.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <thread>

using namespace blockworld;
using namespace blockworld::core;

namespace {

const BlockId DIRT = toId(BlockType::Dirt);
const BlockId STONE = toId(BlockType::Stone);
const BlockId WATER = toId(BlockType::Water);
const BlockId LEAVES = toId(BlockType::Leaves);

bool containsPosition(const std::vector<VisibleBlock>& blocks, int x, int y, int z) {
    return std::any_of(blocks.begin(), blocks.end(), [&](const VisibleBlock& b) {
        return b.position == util::Vector3(x, y, z);
    });
}

} // namespace

TEST(WorldSnapshotTest, ChunkHandleKeepsOldValues) {
    World world(1, 32, 24, 8);
    world.setBlock(2, 2, 2, DIRT);

    ChunkPtr before = world.getChunk(0, 0);
    world.setBlock(2, 2, 2, STONE);

    EXPECT_EQ(before->getBlock(2, 2, 2), DIRT);
    EXPECT_EQ(world.getBlock(2, 2, 2), STONE);
    EXPECT_NE(world.getChunk(0, 0), before);
}

TEST(WorldSnapshotTest, MaterializedChunkHandleIsUnaffectedByWrites) {
    World world(1, 32, 24, 8);
    ChunkPtr held = world.materializeChunk(0, 0);
    const std::vector<BlockId> original = held->getBlocks();

    const int x = 6;
    const int y = 30;
    const int z = 9;
    const BlockId previous = held->getBlock(x, y, z);
    const BlockId replacement = previous == STONE ? DIRT : STONE;
    world.setBlock(x, y, z, replacement);

    ASSERT_EQ(held->getBlocks().size(), original.size());
    const std::size_t written = blockIndex(x, y, z);
    for (std::size_t i = 0; i < original.size(); ++i) {
        ASSERT_EQ(held->getBlocks()[i], original[i]) << "index " << i;
    }
    EXPECT_EQ(held->getBlock(x, y, z), previous);

    // The world's chunk differs from the held one in the written cell only
    ChunkPtr current = world.getChunk(0, 0);
    ASSERT_NE(current, held);
    EXPECT_EQ(current->getBlock(x, y, z), replacement);
    for (std::size_t i = 0; i < original.size(); ++i) {
        if (i != written) {
            ASSERT_EQ(current->getBlocks()[i], original[i]) << "index " << i;
        }
    }
}

TEST(WorldSnapshotTest, SnapshotIgnoresLaterWrites) {
    World world(1, 32, 24, 8);
    world.setBlock(0, 0, 0, DIRT);

    WorldSnapshot snapshot = world.snapshot();
    const uint64_t version = snapshot.getVersion();

    world.setBlock(0, 0, 0, STONE);
    world.setBlock(100, 0, 100, STONE);
    world.addChunk(-3, -3, std::vector<BlockId>(chunkVolume(32), DIRT));

    EXPECT_EQ(snapshot.getBlock(0, 0, 0), DIRT);
    EXPECT_FALSE(snapshot.hasChunk(6, 6));
    EXPECT_FALSE(snapshot.hasChunk(-3, -3));
    EXPECT_EQ(snapshot.chunkCount(), 1u);
    EXPECT_EQ(snapshot.getVersion(), version);

    EXPECT_EQ(world.chunkCount(), 3u);
    EXPECT_EQ(world.getBlock(0, 0, 0), STONE);
}

TEST(WorldSnapshotTest, SnapshotSurvivesReset) {
    World world(1, 32, 24, 8);
    world.setBlock(5, 5, 5, STONE);

    WorldSnapshot snapshot = world.snapshot();
    world.reset(2);

    EXPECT_EQ(snapshot.getBlock(5, 5, 5), STONE);
    EXPECT_EQ(snapshot.getSeed(), 1);
    EXPECT_EQ(world.chunkCount(), 0u);
}

TEST(WorldSnapshotTest, ReadableFromAnotherThread) {
    World world(1, 32, 24, 8);
    world.materializeChunk(0, 0);
    WorldSnapshot snapshot = world.snapshot();

    std::size_t readerCount = 0;
    std::thread reader([&snapshot, &readerCount]() {
        readerCount = snapshot.getChunk(0, 0)->countNonAir();
    });

    // Writer keeps going on this thread
    for (int y = 0; y < 32; ++y) {
        world.setBlock(3, y, 3, AIR);
    }
    reader.join();

    EXPECT_EQ(readerCount, snapshot.getChunk(0, 0)->countNonAir());
}

TEST(WorldSnapshotTest, ChangedSinceReportsTouchedChunks) {
    World world(1, 32, 24, 8);
    world.setBlock(0, 0, 0, DIRT);
    world.setBlock(16, 0, 0, DIRT);

    const uint64_t mark = world.getVersion();
    world.setBlock(17, 1, 0, STONE);
    world.setBlock(-1, 0, -1, STONE);

    std::vector<ChunkCoord> changed = world.snapshot().changedSince(mark);
    ASSERT_EQ(changed.size(), 2u);
    EXPECT_NE(std::find(changed.begin(), changed.end(), ChunkCoord(1, 0)), changed.end());
    EXPECT_NE(std::find(changed.begin(), changed.end(), ChunkCoord(-1, -1)), changed.end());

    EXPECT_EQ(world.snapshot().changedSince(0).size(), 3u);
    EXPECT_TRUE(world.snapshot().changedSince(world.getVersion()).empty());
}

TEST(WorldSnapshotTest, ForEachChunkVisitsAll) {
    World world(1, 32, 24, 8);
    world.setBlock(0, 0, 0, DIRT);
    world.setBlock(32, 0, 0, DIRT);
    world.setBlock(0, 0, -32, DIRT);

    int visited = 0;
    world.snapshot().forEachChunk([&visited](const Chunk& chunk) {
        visited++;
        EXPECT_EQ(chunk.countNonAir(), 1u);
    });
    EXPECT_EQ(visited, 3);
}

TEST(WorldSnapshotTest, BuriedBlocksAreHidden) {
    World world(1, 32, 24, 8);

    // Fill the middle chunk and its four neighbours solid up to y = 9
    for (int cx = -1; cx <= 1; ++cx) {
        for (int cz = -1; cz <= 1; ++cz) {
            std::vector<BlockId> data(chunkVolume(32), AIR);
            for (int y = 0; y < 10; ++y) {
                for (int i = 0; i < CHUNK_SIZE * CHUNK_SIZE; ++i) {
                    data[static_cast<std::size_t>(y * CHUNK_SIZE * CHUNK_SIZE + i)] = STONE;
                }
            }
            world.addChunk(cx, cz, std::move(data));
        }
    }

    WorldSnapshot snapshot = world.snapshot();
    std::vector<VisibleBlock> visible = snapshot.visibleBlocks(0, 0);

    // Top layer and world bottom are exposed, everything between is buried
    EXPECT_EQ(visible.size(), static_cast<std::size_t>(2 * CHUNK_SIZE * CHUNK_SIZE));
    EXPECT_TRUE(containsPosition(visible, 5, 9, 5));
    EXPECT_TRUE(containsPosition(visible, 5, 0, 5));
    EXPECT_FALSE(containsPosition(visible, 5, 4, 5));
    EXPECT_FALSE(containsPosition(visible, 0, 4, 0));
}

TEST(WorldSnapshotTest, MissingNeighbourChunkExposesEdge) {
    World world(1, 32, 24, 8);
    world.addChunk(0, 0, std::vector<BlockId>(chunkVolume(32), STONE));

    std::vector<VisibleBlock> visible = world.snapshot().visibleBlocks(0, 0);

    // Side walls towards missing chunks plus the bottom and top faces
    EXPECT_TRUE(containsPosition(visible, 0, 10, 7));
    EXPECT_TRUE(containsPosition(visible, 15, 10, 7));
    EXPECT_TRUE(containsPosition(visible, 7, 31, 7));
    EXPECT_FALSE(containsPosition(visible, 7, 10, 7));

    for (const VisibleBlock& block : visible) {
        EXPECT_EQ(block.id, STONE);
    }
}

TEST(WorldSnapshotTest, TransparentAndNonSolidNeighboursExpose) {
    World world(1, 32, 24, 8);
    world.addChunk(0, 0, std::vector<BlockId>(chunkVolume(32), STONE));

    world.setBlock(7, 10, 7, WATER);
    world.setBlock(3, 10, 3, LEAVES);

    std::vector<VisibleBlock> visible = world.snapshot().visibleBlocks(0, 0);

    EXPECT_TRUE(containsPosition(visible, 7, 9, 7));
    EXPECT_TRUE(containsPosition(visible, 8, 10, 7));
    EXPECT_FALSE(containsPosition(visible, 7, 10, 7));

    // Leaves let their neighbours show through but are buried themselves
    EXPECT_FALSE(containsPosition(visible, 3, 10, 3));
    EXPECT_TRUE(containsPosition(visible, 3, 11, 3));
    EXPECT_TRUE(containsPosition(visible, 2, 10, 3));
}

TEST(WorldSnapshotTest, MissingChunkHasNoVisibleBlocks) {
    WorldSnapshot empty;
    EXPECT_TRUE(empty.visibleBlocks(0, 0).empty());
    EXPECT_EQ(empty.chunkCount(), 0u);
    EXPECT_EQ(empty.getChunk(0, 0), nullptr);
}
