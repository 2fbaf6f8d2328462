#include "core/Chunk.h"
#include "core/Errors.h"
#include <algorithm>

namespace blockworld {
namespace core {

Chunk::Chunk(ChunkCoord coord, int height)
    : coord(coord)
    , height(height)
    , blocks(chunkVolume(height), AIR)
    , revision(0) {
}

Chunk::Chunk(ChunkCoord coord, int height, std::vector<BlockId> data)
    : coord(coord)
    , height(height)
    , revision(0) {

    const std::size_t expected = chunkVolume(height);
    if (data.size() != expected) {
        throw ShapeMismatch(expected, data.size());
    }

    blocks = std::move(data);
}

BlockId Chunk::getBlock(int x, int y, int z) const {
    if (!isInBounds(x, y, z)) {
        return AIR;
    }

    return blocks[blockIndex(x, y, z)];
}

bool Chunk::setBlock(int x, int y, int z, BlockId id) {
    if (!isInBounds(x, y, z)) {
        return false;
    }

    blocks[blockIndex(x, y, z)] = id;
    return true;
}

const ChunkCoord& Chunk::getCoord() const {
    return coord;
}

int Chunk::getSize() const {
    return CHUNK_SIZE;
}

int Chunk::getHeight() const {
    return height;
}

uint64_t Chunk::getRevision() const {
    return revision;
}

void Chunk::setRevision(uint64_t rev) {
    revision = rev;
}

const std::vector<BlockId>& Chunk::getBlocks() const {
    return blocks;
}

std::size_t Chunk::countNonAir() const {
    return static_cast<std::size_t>(
        std::count_if(blocks.begin(), blocks.end(), [](BlockId id) { return id != AIR; }));
}

int Chunk::columnTop(int x, int z) const {
    if (!isInBounds(x, 0, z)) {
        return 0;
    }

    for (int y = height - 1; y >= 0; --y) {
        if (blocks[blockIndex(x, y, z)] != AIR) {
            return y + 1;
        }
    }
    return 0;
}

} // namespace core
} // namespace blockworld
