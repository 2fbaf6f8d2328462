#pragma once

#include "core/Coordinates.h"
#include <array>
#include <cstddef>

namespace blockworld {
namespace core {

// One hotbar slot
struct InventorySlot {
    BlockId blockType = AIR;
    int count = 0;

    bool isEmpty() const { return count == 0; }
};

/**
 * Player hotbar. Collected blocks go onto an existing stack of the same
 * type first, then into the first empty slot.
 */
class Inventory {
public:
    static constexpr std::size_t SIZE = 9;
    static constexpr int MAX_STACK = 64;

    // Starts with a full stack of dirt and half a stack of stone
    Inventory();

    /**
     * Select the active slot
     * @param index Slot index, clamped to [0, SIZE - 1]
     */
    void selectSlot(int index);

    std::size_t getSelectedSlot() const;

    const InventorySlot& getSelected() const;

    /**
     * Get a slot by index
     * @throws std::out_of_range if index >= SIZE
     */
    const InventorySlot& getSlot(std::size_t index) const;

    const std::array<InventorySlot, SIZE>& getSlots() const;

    /**
     * Add one block
     * @param id Block id to add
     * @return False for air or when no slot can take the block
     * @throws UnknownMaterialId if id is not registered
     */
    bool addBlock(BlockId id);

    /**
     * Take one block from the first slot holding it
     * @return False if no slot holds the block
     */
    bool removeBlock(BlockId id);

    // Total number of blocks of a type across all slots
    int countOf(BlockId id) const;

private:
    std::array<InventorySlot, SIZE> slots;

    std::size_t selectedSlot;
};

} // namespace core
} // namespace blockworld
