#pragma once

#include "core/Coordinates.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace blockworld {
namespace core {

/**
 * A chunk is a CHUNK_SIZE x worldHeight x CHUNK_SIZE column of the world.
 * Published chunks are shared as ChunkPtr and never change; the world copies
 * a chunk before writing to it whenever anyone else still holds it.
 */
class Chunk {
public:
    /**
     * Construct an all-air chunk
     * @param coord Position of the chunk in chunk coordinates
     * @param height Height of the chunk in blocks
     */
    Chunk(ChunkCoord coord, int height);

    /**
     * Construct a chunk from complete block data
     * @param coord Position of the chunk in chunk coordinates
     * @param height Height of the chunk in blocks
     * @param blocks Block ids in index order (lx + lz * CHUNK_SIZE + y * CHUNK_SIZE^2)
     * @throws ShapeMismatch if blocks.size() != CHUNK_SIZE * CHUNK_SIZE * height
     */
    Chunk(ChunkCoord coord, int height, std::vector<BlockId> blocks);

    /**
     * Get the block at a local position
     * @param x X coordinate within the chunk
     * @param y Y coordinate within the chunk
     * @param z Z coordinate within the chunk
     * @return Block id, AIR if the position is outside the chunk
     */
    BlockId getBlock(int x, int y, int z) const;

    /**
     * Set the block at a local position
     * @param x X coordinate within the chunk
     * @param y Y coordinate within the chunk
     * @param z Z coordinate within the chunk
     * @param id Block id to store
     * @return False if the position is outside the chunk
     */
    bool setBlock(int x, int y, int z, BlockId id);

    const ChunkCoord& getCoord() const;

    int getSize() const;

    int getHeight() const;

    /**
     * World version at which the contents of this chunk last changed
     */
    uint64_t getRevision() const;

    void setRevision(uint64_t revision);

    // Raw block data in index order
    const std::vector<BlockId>& getBlocks() const;

    // Number of cells that are not air
    std::size_t countNonAir() const;

    // Height of the highest non-air block in a column plus one, 0 for an empty column
    int columnTop(int x, int z) const;

    inline bool isInBounds(int x, int y, int z) const {
        return x >= 0 && x < CHUNK_SIZE && y >= 0 && y < height && z >= 0 && z < CHUNK_SIZE;
    }

private:
    ChunkCoord coord;

    int height;

    std::vector<BlockId> blocks;

    uint64_t revision;
};

// Read-only handle handed to consumers
using ChunkPtr = std::shared_ptr<const Chunk>;

} // namespace core
} // namespace blockworld
