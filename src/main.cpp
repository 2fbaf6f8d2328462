#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>

#include "core/BlockRegistry.h"
#include "core/ChunkManager.h"
#include "core/World.h"
#include "util/Config.h"
#include "util/ThreadPool.h"

using namespace blockworld;

// Characters for the height map, low to high
static const char HEIGHT_SHADES[] = " .:-=+*#%@";

static void printHeightMap(const core::Chunk& chunk, int worldHeight) {
    const int shades = static_cast<int>(sizeof(HEIGHT_SHADES)) - 2;

    for (int z = 0; z < core::CHUNK_SIZE; ++z) {
        for (int x = 0; x < core::CHUNK_SIZE; ++x) {
            const int top = chunk.columnTop(x, z);
            std::cout << HEIGHT_SHADES[top * shades / worldHeight];
        }
        std::cout << std::endl;
    }
}

int main(int argc, char* argv[]) {
    util::Config config;
    if (!config.parseArguments(argc, argv)) {
        return config.helpRequested ? 0 : 1;
    }
    if (!config.validate()) {
        return 1;
    }

    try {
        core::World world(config);
        util::ThreadPool threadPool(static_cast<size_t>(config.numThreads));
        core::ChunkManager chunkManager(world, config);

        std::cout << "Using " << threadPool.size() << " worker threads" << std::endl;

        // Spawn at the world origin, above the highest possible terrain
        const util::Vector3f spawn(0.5f, static_cast<float>(config.maxTerrainHeight + 2), 0.5f);

        auto start = std::chrono::high_resolution_clock::now();

        chunkManager.updateChunks(spawn, threadPool);
        std::cout << "Queued " << chunkManager.pendingCount() << " chunks around spawn" << std::endl;

        const int generated = chunkManager.finishPending();

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

        std::cout << "Generated " << generated << " chunks in " << elapsed << " ms" << std::endl;

        core::ChunkPtr spawnChunk = world.materializeChunk(0, 0);
        core::WorldSnapshot snapshot = world.snapshot();

        const int spawnHeight = world.getTerrainGenerator()->columnHeight(0, 0);
        std::optional<core::BlockId> surface = snapshot.getBlock(0, spawnHeight > 0 ? spawnHeight - 1 : 0, 0);

        std::cout << "World version: " << snapshot.getVersion() << std::endl;
        std::cout << "Chunks in world: " << snapshot.chunkCount() << std::endl;
        std::cout << "Terrain height at spawn: " << spawnHeight;
        if (surface && core::BlockRegistry::isKnown(*surface)) {
            std::cout << " (" << core::BlockRegistry::properties(*surface).name << ")";
        }
        std::cout << std::endl;
        std::cout << "Non-air blocks in spawn chunk: " << spawnChunk->countNonAir() << std::endl;
        std::cout << "Visible blocks in spawn chunk: " << snapshot.visibleBlocks(0, 0).size() << std::endl;

        std::cout << "Height map of spawn chunk:" << std::endl;
        printHeightMap(*spawnChunk, world.getWorldHeight());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
