#pragma once

#include "core/Coordinates.h"
#include <stdexcept>
#include <string>

namespace blockworld {
namespace core {

/**
 * Raised when chunk data does not have CHUNK_SIZE * CHUNK_SIZE * worldHeight cells.
 * The rejected call has no effect.
 */
class ShapeMismatch : public std::invalid_argument {
public:
    ShapeMismatch(std::size_t expected, std::size_t actual)
        : std::invalid_argument("chunk data has " + std::to_string(actual)
                                + " cells, expected " + std::to_string(expected))
        , expectedSize(expected)
        , actualSize(actual) {}

    std::size_t expected() const { return expectedSize; }
    std::size_t actual() const { return actualSize; }

private:
    std::size_t expectedSize;
    std::size_t actualSize;
};

/**
 * Raised by material lookups for an id the block registry does not know
 */
class UnknownMaterialId : public std::out_of_range {
public:
    explicit UnknownMaterialId(BlockId id)
        : std::out_of_range("unknown block id " + std::to_string(static_cast<int>(id)))
        , blockId(id) {}

    BlockId id() const { return blockId; }

private:
    BlockId blockId;
};

} // namespace core
} // namespace blockworld
