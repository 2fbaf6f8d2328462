#include "core/World.h"
#include "core/BlockRegistry.h"
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>

namespace blockworld {
namespace core {

World::World(const util::Config& config)
    : World(config.seed, config.worldHeight, config.maxTerrainHeight, config.seaLevel) {
}

World::World(int64_t seed, int worldHeight, int maxTerrainHeight, int seaLevel)
    : worldHeight(worldHeight)
    , maxTerrainHeight(maxTerrainHeight)
    , seaLevel(seaLevel)
    , seed(seed)
    , chunks(std::make_shared<ChunkMap>())
    , version(0) {

    if (worldHeight < MIN_WORLD_HEIGHT || worldHeight > MAX_WORLD_HEIGHT) {
        throw std::invalid_argument("world height must be between " + std::to_string(MIN_WORLD_HEIGHT)
                                    + " and " + std::to_string(MAX_WORLD_HEIGHT)
                                    + ", got " + std::to_string(worldHeight));
    }

    terrain = std::make_shared<const generation::TerrainGenerator>(seed, worldHeight, maxTerrainHeight, seaLevel);

    std::cout << "World initialized with seed: " << seed << std::endl;
    std::cout << "World height: " << worldHeight << " blocks" << std::endl;
}

const Chunk* World::findChunk(const ChunkCoord& coord) const {
    auto it = chunks->find(coord);
    return it != chunks->end() ? it->second.get() : nullptr;
}

ChunkMap& World::writableChunks() {
    if (chunks.use_count() > 1) {
        // A snapshot still references this map
        chunks = std::make_shared<ChunkMap>(*chunks);
    }
    return *chunks;
}

Chunk& World::writableChunk(const ChunkCoord& coord) {
    ChunkMap& map = writableChunks();

    auto it = map.find(coord);
    if (it == map.end()) {
        it = map.emplace(coord, std::make_shared<Chunk>(coord, worldHeight)).first;
    } else if (it->second.use_count() > 1) {
        // Someone holds this chunk: write to a private copy
        it->second = std::make_shared<Chunk>(*it->second);
    }

    return *it->second;
}

std::optional<BlockId> World::getBlock(int x, int y, int z) const {
    if (y < 0 || y >= worldHeight) {
        return std::nullopt;
    }

    const Chunk* chunk = findChunk(chunkCoordOf(x, z));
    if (!chunk) {
        return std::nullopt;
    }

    return chunk->getBlock(localCoord(x), y, localCoord(z));
}

uint64_t World::setBlock(int x, int y, int z, BlockId id) {
    if (y < 0 || y >= worldHeight) {
        return version;
    }

    const ChunkCoord coord = chunkCoordOf(x, z);
    const int localX = localCoord(x);
    const int localZ = localCoord(z);

    // Writing the value that is already stored changes nothing
    const Chunk* existing = findChunk(coord);
    if (existing && existing->getBlock(localX, y, localZ) == id) {
        return version;
    }

    Chunk& chunk = writableChunk(coord);
    chunk.setBlock(localX, y, localZ, id);
    chunk.setRevision(++version);

    return version;
}

uint64_t World::removeBlock(int x, int y, int z) {
    return setBlock(x, y, z, AIR);
}

uint64_t World::addChunk(int cx, int cz, std::vector<BlockId> data) {
    const ChunkCoord coord(cx, cz);

    if (!isValidChunkCoord(cx, cz)) {
        throw std::out_of_range("chunk (" + std::to_string(cx) + ", " + std::to_string(cz)
                                + ") lies outside the addressable world");
    }

    // Validates the shape before the world is touched
    auto chunk = std::make_shared<Chunk>(coord, worldHeight, std::move(data));

    chunk->setRevision(++version);
    writableChunks()[coord] = std::move(chunk);

    return version;
}

ChunkPtr World::materializeChunk(int cx, int cz) {
    if (!hasChunk(cx, cz)) {
        addChunk(cx, cz, terrain->populateChunk(cx, cz));
    }

    return getChunk(cx, cz);
}

ChunkPtr World::getChunk(int cx, int cz) const {
    auto it = chunks->find(ChunkCoord(cx, cz));
    if (it != chunks->end()) {
        return it->second;
    }

    return nullptr;
}

bool World::hasChunk(int cx, int cz) const {
    return findChunk(ChunkCoord(cx, cz)) != nullptr;
}

std::size_t World::chunkCount() const {
    return chunks->size();
}

bool World::isSolid(int x, int y, int z) const {
    std::optional<BlockId> block = getBlock(x, y, z);
    return block && BlockRegistry::isSolid(*block);
}

WorldSnapshot World::snapshot() const {
    return WorldSnapshot(chunks, version, seed, worldHeight);
}

void World::reset(std::optional<int64_t> newSeed) {
    seed = newSeed ? *newSeed : randomSeed();

    terrain = std::make_shared<const generation::TerrainGenerator>(seed, worldHeight, maxTerrainHeight, seaLevel);
    chunks = std::make_shared<ChunkMap>();
    playerPosition = util::Vector3f();

    // Keep counting up so holders of an older version see the change
    ++version;

    std::cout << "World reset with seed: " << seed << std::endl;
}

int64_t World::getSeed() const {
    return seed;
}

int World::getWorldHeight() const {
    return worldHeight;
}

uint64_t World::getVersion() const {
    return version;
}

const util::Vector3f& World::getPlayerPosition() const {
    return playerPosition;
}

void World::setPlayerPosition(const util::Vector3f& position) {
    playerPosition = position;
}

std::shared_ptr<const generation::TerrainGenerator> World::getTerrainGenerator() const {
    return terrain;
}

int64_t World::randomSeed() {
    std::random_device device;
    std::mt19937_64 rng((static_cast<uint64_t>(device()) << 32) | device());
    std::uniform_int_distribution<int64_t> distribution(0, std::numeric_limits<int64_t>::max());
    return distribution(rng);
}

} // namespace core
} // namespace blockworld
