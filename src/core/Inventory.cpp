#include "core/Inventory.h"
#include "core/BlockRegistry.h"
#include "core/Errors.h"
#include <stdexcept>
#include <string>

namespace blockworld {
namespace core {

Inventory::Inventory() : selectedSlot(0) {
    slots[0] = InventorySlot{ toId(BlockType::Dirt), MAX_STACK };
    slots[1] = InventorySlot{ toId(BlockType::Stone), MAX_STACK / 2 };
}

void Inventory::selectSlot(int index) {
    if (index < 0) {
        index = 0;
    } else if (index >= static_cast<int>(SIZE)) {
        index = static_cast<int>(SIZE) - 1;
    }
    selectedSlot = static_cast<std::size_t>(index);
}

std::size_t Inventory::getSelectedSlot() const {
    return selectedSlot;
}

const InventorySlot& Inventory::getSelected() const {
    return slots[selectedSlot];
}

const InventorySlot& Inventory::getSlot(std::size_t index) const {
    if (index >= SIZE) {
        throw std::out_of_range("inventory slot " + std::to_string(index) + " does not exist");
    }
    return slots[index];
}

const std::array<InventorySlot, Inventory::SIZE>& Inventory::getSlots() const {
    return slots;
}

bool Inventory::addBlock(BlockId id) {
    if (!BlockRegistry::isKnown(id)) {
        throw UnknownMaterialId(id);
    }
    if (id == AIR) {
        return false;
    }

    // Top up an existing stack
    for (InventorySlot& slot : slots) {
        if (!slot.isEmpty() && slot.blockType == id && slot.count < MAX_STACK) {
            slot.count++;
            return true;
        }
    }

    for (InventorySlot& slot : slots) {
        if (slot.isEmpty()) {
            slot.blockType = id;
            slot.count = 1;
            return true;
        }
    }

    return false;
}

bool Inventory::removeBlock(BlockId id) {
    if (id == AIR) {
        return false;
    }

    for (InventorySlot& slot : slots) {
        if (!slot.isEmpty() && slot.blockType == id) {
            if (--slot.count == 0) {
                slot.blockType = AIR;
            }
            return true;
        }
    }

    return false;
}

int Inventory::countOf(BlockId id) const {
    int total = 0;
    for (const InventorySlot& slot : slots) {
        if (!slot.isEmpty() && slot.blockType == id) {
            total += slot.count;
        }
    }
    return total;
}

} // namespace core
} // namespace blockworld
