#pragma once

#include "core/Chunk.h"
#include "core/Coordinates.h"
#include "core/WorldSnapshot.h"
#include "generation/TerrainGenerator.h"
#include "util/Config.h"
#include "util/Vector3.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace blockworld {
namespace core {

/**
 * The world owns every chunk and the terrain source used to populate them.
 *
 * All mutations happen on one thread. Chunks handed out through getChunk()
 * and snapshot() are never modified afterwards: a write to a shared chunk
 * replaces it with a modified copy.
 */
class World {
public:
    /**
     * Constructor
     * @param config Configuration for the world
     * @throws std::invalid_argument if the world height is outside [MIN_WORLD_HEIGHT, MAX_WORLD_HEIGHT]
     */
    explicit World(const util::Config& config);

    /**
     * Constructor
     * @param seed Seed for terrain generation
     * @param worldHeight Height of every chunk in blocks
     * @param maxTerrainHeight Upper bound of generated terrain
     * @param seaLevel Water fills air below this height, 0 disables water
     */
    World(int64_t seed, int worldHeight, int maxTerrainHeight, int seaLevel);

    /**
     * Get the block at a world position. Never creates a chunk.
     * @param x X coordinate in world space
     * @param y Y coordinate in world space
     * @param z Z coordinate in world space
     * @return Block id (AIR included), or nullopt if y is outside the world or the chunk does not exist
     */
    std::optional<BlockId> getBlock(int x, int y, int z) const;

    /**
     * Set the block at a world position, creating an all-air chunk if needed.
     * Does nothing if y is outside the world.
     * @param x X coordinate in world space
     * @param y Y coordinate in world space
     * @param z Z coordinate in world space
     * @param id Block id to store
     * @return World version after the call
     */
    uint64_t setBlock(int x, int y, int z, BlockId id);

    /**
     * Replace the block at a world position with air
     * @return World version after the call
     */
    uint64_t removeBlock(int x, int y, int z);

    /**
     * Insert or replace a complete chunk
     * @param cx X coordinate of the chunk
     * @param cz Z coordinate of the chunk
     * @param data Block ids in chunk index order
     * @return World version after the call
     * @throws ShapeMismatch if data does not hold CHUNK_SIZE * CHUNK_SIZE * worldHeight cells; the world is unchanged
     * @throws std::out_of_range if (cx, cz) is outside [MIN_CHUNK_COORD, MAX_CHUNK_COORD]; the world is unchanged
     */
    uint64_t addChunk(int cx, int cz, std::vector<BlockId> data);

    /**
     * Get a chunk, generating its terrain first if it does not exist yet
     * @return The chunk at (cx, cz)
     * @throws std::out_of_range if (cx, cz) is outside [MIN_CHUNK_COORD, MAX_CHUNK_COORD]
     */
    ChunkPtr materializeChunk(int cx, int cz);

    /**
     * Get a chunk by chunk coordinates
     * @return The chunk, or nullptr if it has not been created
     */
    ChunkPtr getChunk(int cx, int cz) const;

    bool hasChunk(int cx, int cz) const;

    std::size_t chunkCount() const;

    /**
     * Whether the block at a world position exists and is solid
     */
    bool isSolid(int x, int y, int z) const;

    /**
     * Take an immutable view of all chunks at the current version
     */
    WorldSnapshot snapshot() const;

    /**
     * Drop every chunk and start over with a new terrain seed
     * @param newSeed Seed to use, a random one if empty
     */
    void reset(std::optional<int64_t> newSeed = std::nullopt);

    int64_t getSeed() const;

    int getWorldHeight() const;

    /**
     * Counter incremented by every mutation, including reset
     */
    uint64_t getVersion() const;

    const util::Vector3f& getPlayerPosition() const;

    void setPlayerPosition(const util::Vector3f& position);

    /**
     * Terrain source for the current seed. Shared so that workers can keep
     * using it across a reset.
     */
    std::shared_ptr<const generation::TerrainGenerator> getTerrainGenerator() const;

private:
    int worldHeight;
    int maxTerrainHeight;
    int seaLevel;

    int64_t seed;

    std::shared_ptr<const generation::TerrainGenerator> terrain;

    // Shared with snapshots; copied before modification while shared
    std::shared_ptr<ChunkMap> chunks;

    uint64_t version;

    util::Vector3f playerPosition;

    const Chunk* findChunk(const ChunkCoord& coord) const;

    // Chunk map that no snapshot shares
    ChunkMap& writableChunks();

    // Chunk that nobody else holds, created as air if missing
    Chunk& writableChunk(const ChunkCoord& coord);

    static int64_t randomSeed();
};

} // namespace core
} // namespace blockworld
