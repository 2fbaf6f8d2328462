#pragma once

#include "core/Chunk.h"
#include "core/Coordinates.h"
#include "generation/TerrainGenerator.h"
#include "util/Config.h"
#include "util/ThreadPool.h"
#include "util/Vector3.h"
#include <future>
#include <memory>
#include <unordered_map>
#include <vector>

namespace blockworld {
namespace core {

// Forward declarations
class World;

/**
 * Generates chunks around the player on a thread pool and hands the
 * finished data to the world. Workers only produce block data; all world
 * mutation happens in processCompletedChunks() on the caller's thread.
 */
class ChunkManager {
public:
    /**
     * Constructor
     * @param world Reference to the world
     * @param config Configuration providing the view distance
     */
    ChunkManager(World& world, const util::Config& config);

    /**
     * Constructor
     * @param world Reference to the world
     * @param viewDistance Radius in chunks generated around the player
     */
    ChunkManager(World& world, int viewDistance);

    /**
     * Record the player position and request every missing chunk within the view distance
     * @param playerPos Position of the player in world coordinates
     * @param threadPool Thread pool for chunk generation
     */
    void updateChunks(const util::Vector3f& playerPos, util::ThreadPool& threadPool);

    /**
     * Request a chunk to be generated. Does nothing if the chunk exists, is pending,
     * or lies outside the valid chunk range.
     * @param coord Position of the chunk in chunk coordinates
     * @param threadPool Thread pool for chunk generation
     */
    void requestChunk(const ChunkCoord& coord, util::ThreadPool& threadPool);

    /**
     * Integrate finished generation tasks into the world without blocking
     * @return Number of chunks added to the world
     */
    int processCompletedChunks();

    /**
     * Wait for every pending task, then integrate the results
     * @return Number of chunks added to the world
     */
    int finishPending();

    std::size_t pendingCount() const;

    bool isPending(const ChunkCoord& coord) const;

    /**
     * Square spiral of chunk offsets, centre first
     * @param viewDistance Radius of the spiral in chunks
     */
    static std::vector<ChunkCoord> calculateSpiralPattern(int viewDistance);

private:
    struct PendingChunk {
        std::future<std::vector<BlockId>> data;

        // Generator the task was started with, to spot results from before a reset
        std::shared_ptr<const generation::TerrainGenerator> generator;
    };

    // Reference to the world
    World& world;

    int viewDistance;

    // Chunks being generated
    std::unordered_map<ChunkCoord, PendingChunk, ChunkCoord::Hash> pendingChunks;

    // Add one finished result to the world, returns true if it was used
    bool integrate(const ChunkCoord& coord, PendingChunk& pending);
};

} // namespace core
} // namespace blockworld
