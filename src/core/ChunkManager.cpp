#include "core/ChunkManager.h"
#include "core/World.h"
#include <chrono>
#include <iostream>

namespace blockworld {
namespace core {

ChunkManager::ChunkManager(World& world, const util::Config& config)
    : ChunkManager(world, config.viewDistance) {
}

ChunkManager::ChunkManager(World& world, int viewDistance)
    : world(world)
    , viewDistance(viewDistance < 0 ? 0 : viewDistance) {
}

void ChunkManager::updateChunks(const util::Vector3f& playerPos, util::ThreadPool& threadPool) {
    world.setPlayerPosition(playerPos);

    const util::Vector3 block = playerPos.toBlock();
    const ChunkCoord center = chunkCoordOf(block.x, block.z);

    for (const ChunkCoord& offset : calculateSpiralPattern(viewDistance)) {
        requestChunk(ChunkCoord(center.cx + offset.cx, center.cz + offset.cz), threadPool);
    }
}

void ChunkManager::requestChunk(const ChunkCoord& coord, util::ThreadPool& threadPool) {
    if (!isValidChunkCoord(coord.cx, coord.cz)) {
        return;
    }
    if (world.hasChunk(coord.cx, coord.cz) || isPending(coord)) {
        return;
    }

    std::shared_ptr<const generation::TerrainGenerator> generator = world.getTerrainGenerator();

    PendingChunk pending;
    pending.generator = generator;
    pending.data = threadPool.enqueue([generator, coord]() {
        return generator->populateChunk(coord.cx, coord.cz);
    });

    pendingChunks.emplace(coord, std::move(pending));
}

bool ChunkManager::integrate(const ChunkCoord& coord, PendingChunk& pending) {
    try {
        std::vector<BlockId> data = pending.data.get();

        // Generated for a seed the world no longer uses
        if (pending.generator != world.getTerrainGenerator()) {
            return false;
        }

        // Created by a write while generating; keep the edits
        if (world.hasChunk(coord.cx, coord.cz)) {
            return false;
        }

        world.addChunk(coord.cx, coord.cz, std::move(data));
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error processing chunk at position ("
                  << coord.cx << ", " << coord.cz
                  << "): " << e.what() << std::endl;
        return false;
    }
}

int ChunkManager::processCompletedChunks() {
    int processed = 0;
    std::vector<ChunkCoord> completedPositions;

    for (auto& [coord, pending] : pendingChunks) {
        // Check if the task is complete without blocking
        if (pending.data.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
            if (integrate(coord, pending)) {
                processed++;
            }
            completedPositions.push_back(coord);
        }
    }

    for (const auto& coord : completedPositions) {
        pendingChunks.erase(coord);
    }

    return processed;
}

int ChunkManager::finishPending() {
    int processed = 0;

    for (auto& [coord, pending] : pendingChunks) {
        pending.data.wait();
        if (integrate(coord, pending)) {
            processed++;
        }
    }
    pendingChunks.clear();

    return processed;
}

std::size_t ChunkManager::pendingCount() const {
    return pendingChunks.size();
}

bool ChunkManager::isPending(const ChunkCoord& coord) const {
    return pendingChunks.find(coord) != pendingChunks.end();
}

std::vector<ChunkCoord> ChunkManager::calculateSpiralPattern(int viewDistance) {
    std::vector<ChunkCoord> pattern;

    if (viewDistance < 0) {
        return pattern;
    }

    pattern.reserve(static_cast<std::size_t>(2 * viewDistance + 1) * (2 * viewDistance + 1));

    // Centre chunk
    pattern.push_back(ChunkCoord(0, 0));

    for (int layer = 1; layer <= viewDistance; ++layer) {
        // Top edge
        for (int x = -layer; x <= layer; ++x) {
            pattern.push_back(ChunkCoord(x, -layer));
        }

        // Right edge
        for (int z = -layer + 1; z <= layer; ++z) {
            pattern.push_back(ChunkCoord(layer, z));
        }

        // Bottom edge
        for (int x = layer - 1; x >= -layer; --x) {
            pattern.push_back(ChunkCoord(x, layer));
        }

        // Left edge
        for (int z = layer - 1; z >= -layer + 1; --z) {
            pattern.push_back(ChunkCoord(-layer, z));
        }
    }

    return pattern;
}

} // namespace core
} // namespace blockworld
