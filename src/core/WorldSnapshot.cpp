#include "core/WorldSnapshot.h"
#include "core/BlockRegistry.h"

namespace blockworld {
namespace core {

namespace {

// Face neighbours of a block
const int NEIGHBOUR_OFFSETS[6][3] = {
    { 1, 0, 0 }, { -1, 0, 0 },
    { 0, 1, 0 }, { 0, -1, 0 },
    { 0, 0, 1 }, { 0, 0, -1 }
};

} // namespace

WorldSnapshot::WorldSnapshot()
    : chunks(std::make_shared<const ChunkMap>())
    , version(0)
    , seed(0)
    , worldHeight(MIN_WORLD_HEIGHT) {
}

WorldSnapshot::WorldSnapshot(std::shared_ptr<const ChunkMap> chunks, uint64_t version, int64_t seed, int worldHeight)
    : chunks(std::move(chunks))
    , version(version)
    , seed(seed)
    , worldHeight(worldHeight) {
}

const Chunk* WorldSnapshot::findChunk(const ChunkCoord& coord) const {
    auto it = chunks->find(coord);
    return it != chunks->end() ? it->second.get() : nullptr;
}

std::optional<BlockId> WorldSnapshot::getBlock(int x, int y, int z) const {
    if (y < 0 || y >= worldHeight) {
        return std::nullopt;
    }

    const Chunk* chunk = findChunk(chunkCoordOf(x, z));
    if (!chunk) {
        return std::nullopt;
    }

    return chunk->getBlock(localCoord(x), y, localCoord(z));
}

ChunkPtr WorldSnapshot::getChunk(int cx, int cz) const {
    auto it = chunks->find(ChunkCoord(cx, cz));
    if (it != chunks->end()) {
        return it->second;
    }

    return nullptr;
}

bool WorldSnapshot::hasChunk(int cx, int cz) const {
    return findChunk(ChunkCoord(cx, cz)) != nullptr;
}

std::size_t WorldSnapshot::chunkCount() const {
    return chunks->size();
}

uint64_t WorldSnapshot::getVersion() const {
    return version;
}

int64_t WorldSnapshot::getSeed() const {
    return seed;
}

int WorldSnapshot::getWorldHeight() const {
    return worldHeight;
}

std::vector<VisibleBlock> WorldSnapshot::visibleBlocks(int cx, int cz) const {
    std::vector<VisibleBlock> visible;

    const Chunk* chunk = findChunk(ChunkCoord(cx, cz));
    if (!chunk) {
        return visible;
    }

    // Neighbouring chunks, looked up once
    const Chunk* east = findChunk(ChunkCoord(cx + 1, cz));
    const Chunk* west = findChunk(ChunkCoord(cx - 1, cz));
    const Chunk* south = findChunk(ChunkCoord(cx, cz + 1));
    const Chunk* north = findChunk(ChunkCoord(cx, cz - 1));

    auto isExposed = [&](int lx, int y, int lz) {
        if (y < 0 || y >= worldHeight) {
            return true;
        }

        const Chunk* owner = chunk;
        if (lx >= CHUNK_SIZE) {
            owner = east;
            lx -= CHUNK_SIZE;
        } else if (lx < 0) {
            owner = west;
            lx += CHUNK_SIZE;
        } else if (lz >= CHUNK_SIZE) {
            owner = south;
            lz -= CHUNK_SIZE;
        } else if (lz < 0) {
            owner = north;
            lz += CHUNK_SIZE;
        }

        if (!owner) {
            return true;
        }

        const BlockId neighbour = owner->getBlock(lx, y, lz);
        return !BlockRegistry::isSolid(neighbour) || BlockRegistry::isTransparent(neighbour);
    };

    // Stored chunks are within the valid chunk range, so block positions fit in an int
    const int originX = static_cast<int>(chunkOrigin(cx));
    const int originZ = static_cast<int>(chunkOrigin(cz));

    for (int y = 0; y < chunk->getHeight(); ++y) {
        for (int lz = 0; lz < CHUNK_SIZE; ++lz) {
            for (int lx = 0; lx < CHUNK_SIZE; ++lx) {
                const BlockId id = chunk->getBlock(lx, y, lz);
                if (!BlockRegistry::isSolid(id)) {
                    continue;
                }

                for (const auto& offset : NEIGHBOUR_OFFSETS) {
                    if (isExposed(lx + offset[0], y + offset[1], lz + offset[2])) {
                        visible.push_back(VisibleBlock{
                            util::Vector3(originX + lx, y, originZ + lz),
                            id
                        });
                        break;
                    }
                }
            }
        }
    }

    return visible;
}

std::vector<ChunkCoord> WorldSnapshot::changedSince(uint64_t sinceVersion) const {
    std::vector<ChunkCoord> changed;

    for (const auto& [coord, chunk] : *chunks) {
        if (chunk && chunk->getRevision() > sinceVersion) {
            changed.push_back(coord);
        }
    }

    return changed;
}

void WorldSnapshot::forEachChunk(const std::function<void(const Chunk&)>& callback) const {
    if (!callback) return;

    for (const auto& [coord, chunk] : *chunks) {
        if (chunk) {
            callback(*chunk);
        }
    }
}

} // namespace core
} // namespace blockworld
