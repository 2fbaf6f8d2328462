#include "core/BlockRegistry.h"
#include "core/Errors.h"

namespace blockworld {
namespace core {

// Indexed by BlockType
const std::array<BlockProperties, static_cast<std::size_t>(BlockType::Count)> BlockRegistry::table = {{
    // name          color     solid  transparent
    { "air",         0x000000, false, true  },
    { "dirt",        0x8b5a2b, true,  false },
    { "grass",       0x4a7c23, true,  false },
    { "stone",       0x808080, true,  false },
    { "wood",        0x6b4423, true,  false },
    { "leaves",      0x2d5a1d, true,  true  },
    { "sand",        0xc2b280, true,  false },
    { "water",       0x3366cc, false, true  },
    { "cobblestone", 0x6e6e6e, true,  false },
    { "planks",      0xb8860b, true,  false },
}};

const BlockProperties& BlockRegistry::properties(BlockId id) {
    if (!isKnown(id)) {
        throw UnknownMaterialId(id);
    }
    return table[id];
}

bool BlockRegistry::isKnown(BlockId id) {
    return id < table.size();
}

bool BlockRegistry::isSolid(BlockId id) {
    return isKnown(id) && table[id].isSolid;
}

bool BlockRegistry::isTransparent(BlockId id) {
    return !isKnown(id) || table[id].isTransparent;
}

std::optional<BlockId> BlockRegistry::fromName(const std::string& name) {
    for (std::size_t i = 0; i < table.size(); ++i) {
        if (name == table[i].name) {
            return static_cast<BlockId>(i);
        }
    }
    return std::nullopt;
}

} // namespace core
} // namespace blockworld
