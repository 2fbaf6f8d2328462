#pragma once

#include "core/Coordinates.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace blockworld {
namespace core {

// Kinds of blocks that can exist in the world
enum class BlockType : BlockId {
    Air = 0,
    Dirt,
    Grass,
    Stone,
    Wood,
    Leaves,
    Sand,
    Water,
    Cobblestone,
    Planks,
    Count  // Always keep this as the last element
};

constexpr BlockId toId(BlockType type) {
    return static_cast<BlockId>(type);
}

// Display and physical metadata for a block kind
struct BlockProperties {
    const char* name;      // Lowercase identifier
    uint32_t color;        // 0xRRGGBB render colour
    bool isSolid;          // Whether the block stops movement
    bool isTransparent;    // Whether faces behind it stay visible
};

/**
 * Lookup table from block ids to their metadata. The world store never
 * consults it on the storage path; renderers, physics and the inventory do.
 */
class BlockRegistry {
public:
    /**
     * Get the metadata for a block id
     * @param id Block id
     * @return Properties of the block
     * @throws UnknownMaterialId if the id is not registered
     */
    static const BlockProperties& properties(BlockId id);

    static bool isKnown(BlockId id);

    // Unknown ids are treated as non-solid
    static bool isSolid(BlockId id);

    // Unknown ids are treated as transparent
    static bool isTransparent(BlockId id);

    /**
     * Find a block id by its name
     * @param name Lowercase block name, e.g. "stone"
     * @return The id, or nullopt if no block has that name
     */
    static std::optional<BlockId> fromName(const std::string& name);

    // Number of registered ids including air
    static constexpr std::size_t size() {
        return static_cast<std::size_t>(BlockType::Count);
    }

private:
    static const std::array<BlockProperties, static_cast<std::size_t>(BlockType::Count)> table;
};

} // namespace core
} // namespace blockworld
