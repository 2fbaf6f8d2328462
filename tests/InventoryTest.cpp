#include "core/BlockRegistry.h"
#include "core/Errors.h"
#include "core/Inventory.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace blockworld::core;

namespace {

const BlockId DIRT = toId(BlockType::Dirt);
const BlockId STONE = toId(BlockType::Stone);
const BlockId SAND = toId(BlockType::Sand);
const BlockId WOOD = toId(BlockType::Wood);

} // namespace

TEST(InventoryTest, StartingContents) {
    Inventory inventory;

    EXPECT_EQ(inventory.getSlot(0).blockType, DIRT);
    EXPECT_EQ(inventory.getSlot(0).count, 64);
    EXPECT_EQ(inventory.getSlot(1).blockType, STONE);
    EXPECT_EQ(inventory.getSlot(1).count, 32);
    for (std::size_t i = 2; i < Inventory::SIZE; ++i) {
        EXPECT_TRUE(inventory.getSlot(i).isEmpty());
    }

    EXPECT_EQ(inventory.getSelectedSlot(), 0u);
    EXPECT_EQ(inventory.getSelected().blockType, DIRT);
    EXPECT_THROW(inventory.getSlot(Inventory::SIZE), std::out_of_range);
}

TEST(InventoryTest, SelectSlotClamps) {
    Inventory inventory;

    inventory.selectSlot(4);
    EXPECT_EQ(inventory.getSelectedSlot(), 4u);
    inventory.selectSlot(-3);
    EXPECT_EQ(inventory.getSelectedSlot(), 0u);
    inventory.selectSlot(42);
    EXPECT_EQ(inventory.getSelectedSlot(), 8u);
}

TEST(InventoryTest, AddTopsUpExistingStackFirst) {
    Inventory inventory;

    EXPECT_TRUE(inventory.addBlock(STONE));
    EXPECT_EQ(inventory.getSlot(1).count, 33);
    EXPECT_TRUE(inventory.getSlot(2).isEmpty());
}

TEST(InventoryTest, FullStackSpillsIntoFirstEmptySlot) {
    Inventory inventory;

    EXPECT_TRUE(inventory.addBlock(DIRT));
    EXPECT_EQ(inventory.getSlot(0).count, 64);
    EXPECT_EQ(inventory.getSlot(2).blockType, DIRT);
    EXPECT_EQ(inventory.getSlot(2).count, 1);
    EXPECT_EQ(inventory.countOf(DIRT), 65);

    EXPECT_TRUE(inventory.addBlock(SAND));
    EXPECT_EQ(inventory.getSlot(3).blockType, SAND);
}

TEST(InventoryTest, RejectsWhenFull) {
    Inventory inventory;
    const BlockId kinds[] = { SAND, WOOD, toId(BlockType::Grass), toId(BlockType::Leaves),
                              toId(BlockType::Planks), toId(BlockType::Cobblestone), toId(BlockType::Water) };
    for (BlockId id : kinds) {
        EXPECT_TRUE(inventory.addBlock(id));
    }

    // Every slot is now in use; stacks with room still accept their type
    EXPECT_TRUE(inventory.addBlock(SAND));
    EXPECT_EQ(inventory.countOf(SAND), 2);

    // Dirt's stack is full and there is no empty slot left
    EXPECT_FALSE(inventory.addBlock(DIRT));
    EXPECT_EQ(inventory.countOf(DIRT), 64);
}

TEST(InventoryTest, AirAndUnknownIds) {
    Inventory inventory;

    EXPECT_FALSE(inventory.addBlock(AIR));
    EXPECT_THROW(inventory.addBlock(250), UnknownMaterialId);
    EXPECT_FALSE(inventory.removeBlock(AIR));
}

TEST(InventoryTest, RemoveEmptiesSlotAtZero) {
    Inventory inventory;

    inventory.addBlock(WOOD);
    EXPECT_EQ(inventory.getSlot(2).count, 1);

    EXPECT_TRUE(inventory.removeBlock(WOOD));
    EXPECT_TRUE(inventory.getSlot(2).isEmpty());
    EXPECT_EQ(inventory.getSlot(2).blockType, AIR);

    EXPECT_FALSE(inventory.removeBlock(WOOD));

    EXPECT_TRUE(inventory.removeBlock(STONE));
    EXPECT_EQ(inventory.countOf(STONE), 31);
}
