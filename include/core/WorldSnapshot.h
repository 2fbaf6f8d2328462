#pragma once

#include "core/Chunk.h"
#include "core/Coordinates.h"
#include "util/Vector3.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace blockworld {
namespace core {

// Chunk storage shared between the world and its snapshots
using ChunkMap = std::unordered_map<ChunkCoord, std::shared_ptr<Chunk>, ChunkCoord::Hash>;

/**
 * A solid block with at least one exposed face, as handed to the renderer
 */
struct VisibleBlock {
    util::Vector3 position;   // World coordinates
    BlockId id;
};

/**
 * Immutable view of the world's chunks at one version. Later writes to the
 * world never show up here, so a snapshot can be read from another thread.
 */
class WorldSnapshot {
public:
    WorldSnapshot();

    WorldSnapshot(std::shared_ptr<const ChunkMap> chunks, uint64_t version, int64_t seed, int worldHeight);

    /**
     * Get the block at a world position
     * @return Block id, or nullopt if y is out of range or the chunk does not exist
     */
    std::optional<BlockId> getBlock(int x, int y, int z) const;

    /**
     * Get a chunk by chunk coordinates
     * @return The chunk, or nullptr if it does not exist in this snapshot
     */
    ChunkPtr getChunk(int cx, int cz) const;

    bool hasChunk(int cx, int cz) const;

    std::size_t chunkCount() const;

    uint64_t getVersion() const;

    int64_t getSeed() const;

    int getWorldHeight() const;

    /**
     * Collect the solid blocks of a chunk that have a face exposed to a
     * non-solid or transparent neighbour, a missing chunk, or the world's
     * top or bottom
     * @param cx X coordinate of the chunk
     * @param cz Z coordinate of the chunk
     * @return Visible blocks, empty if the chunk does not exist
     */
    std::vector<VisibleBlock> visibleBlocks(int cx, int cz) const;

    /**
     * Chunks whose contents changed after the given world version
     */
    std::vector<ChunkCoord> changedSince(uint64_t version) const;

    void forEachChunk(const std::function<void(const Chunk&)>& callback) const;

private:
    std::shared_ptr<const ChunkMap> chunks;
    uint64_t version;
    int64_t seed;
    int worldHeight;

    const Chunk* findChunk(const ChunkCoord& coord) const;
};

} // namespace core
} // namespace blockworld
