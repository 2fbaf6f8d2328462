#include "generation/TerrainGenerator.h"
#include "core/BlockRegistry.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace blockworld {
namespace generation {

const std::vector<Octave>& defaultOctaves() {
    static const std::vector<Octave> octaves = {
        { 1.0,  0.01 },
        { 0.5,  0.02 },
        { 0.25, 0.04 },
    };
    return octaves;
}

void validateOctaves(const std::vector<Octave>& octaves) {
    if (octaves.empty()) {
        throw std::invalid_argument("octave list is empty");
    }

    for (std::size_t i = 0; i < octaves.size(); ++i) {
        const Octave& octave = octaves[i];
        if (!(octave.amplitude > 0.0) || !std::isfinite(octave.amplitude)) {
            throw std::invalid_argument("octave " + std::to_string(i) + " has a non-positive amplitude");
        }
        if (!std::isfinite(octave.frequency)) {
            throw std::invalid_argument("octave " + std::to_string(i) + " has a non-finite frequency");
        }
        if (i == 0) {
            continue;
        }
        if (octave.amplitude >= octaves[i - 1].amplitude) {
            throw std::invalid_argument("octave " + std::to_string(i) + " amplitude does not decrease");
        }
        if (octave.frequency <= octaves[i - 1].frequency) {
            throw std::invalid_argument("octave " + std::to_string(i) + " frequency does not increase");
        }
    }
}

NoiseGenerator createTerrainSource(int64_t seed) {
    return NoiseGenerator(seed);
}

double terrainHeight(const NoiseGenerator& source, double x, double z, double maxHeight,
                     const std::vector<Octave>& octaves) {
    if (!(maxHeight > 0.0)) {
        return 0.0;
    }

    double weightedSum = 0.0;
    double totalAmplitude = 0.0;

    for (const Octave& octave : octaves) {
        weightedSum += source.sample(x * octave.frequency, z * octave.frequency) * octave.amplitude;
        totalAmplitude += octave.amplitude;
    }

    if (!(totalAmplitude > 0.0)) {
        return 0.0;
    }

    // Dividing by the same amplitudes used as weights keeps the result in [0, 1]
    const double normalized = std::clamp(weightedSum / totalAmplitude, 0.0, 1.0);
    return normalized * maxHeight;
}

TerrainGenerator::TerrainGenerator(const util::Config& config)
    : TerrainGenerator(config.seed, config.worldHeight, config.maxTerrainHeight, config.seaLevel) {
}

TerrainGenerator::TerrainGenerator(int64_t seed, int worldHeight, int maxTerrainHeight, int seaLevel,
                                   std::vector<Octave> octaveList)
    : noise(seed)
    , octaves(std::move(octaveList))
    , worldHeight(worldHeight)
    , maxTerrainHeight(maxTerrainHeight)
    , seaLevel(std::clamp(seaLevel, 0, std::max(worldHeight, 0))) {
    if (worldHeight < 1) {
        throw std::invalid_argument("world height must be positive, got " + std::to_string(worldHeight));
    }
    validateOctaves(octaves);
}

double TerrainGenerator::terrainHeight(double x, double z, double maxHeight) const {
    return generation::terrainHeight(noise, x, z, maxHeight, octaves);
}

int TerrainGenerator::columnHeight(int64_t x, int64_t z) const {
    const double height = terrainHeight(static_cast<double>(x), static_cast<double>(z), maxTerrainHeight);
    const int stacked = static_cast<int>(std::floor(height));
    return std::clamp(stacked, 0, worldHeight);
}

core::BlockId TerrainGenerator::blockForColumn(int y, int h) const {
    using core::BlockType;

    if (y < h) {
        if (y == h - 1) {
            // Surface block, beaches at or below the water line
            return core::toId(h <= seaLevel ? BlockType::Sand : BlockType::Grass);
        }
        if (y >= h - 4) {
            return core::toId(BlockType::Dirt);
        }
        return core::toId(BlockType::Stone);
    }

    if (y < seaLevel) {
        return core::toId(BlockType::Water);
    }

    return core::AIR;
}

std::vector<core::BlockId> TerrainGenerator::populateChunk(int cx, int cz) const {
    std::vector<core::BlockId> blocks(core::chunkVolume(worldHeight), core::AIR);

    const int64_t originX = core::chunkOrigin(cx);
    const int64_t originZ = core::chunkOrigin(cz);

    for (int z = 0; z < core::CHUNK_SIZE; ++z) {
        for (int x = 0; x < core::CHUNK_SIZE; ++x) {
            const int h = columnHeight(originX + x, originZ + z);

            // Only the stacked blocks and the water above them need writing
            const int top = std::max(h, seaLevel);
            for (int y = 0; y < top; ++y) {
                blocks[core::blockIndex(x, y, z)] = blockForColumn(y, h);
            }
        }
    }

    return blocks;
}

const NoiseGenerator& TerrainGenerator::getNoise() const {
    return noise;
}

int64_t TerrainGenerator::getSeed() const {
    return noise.getSeed();
}

int TerrainGenerator::getWorldHeight() const {
    return worldHeight;
}

int TerrainGenerator::getMaxTerrainHeight() const {
    return maxTerrainHeight;
}

int TerrainGenerator::getSeaLevel() const {
    return seaLevel;
}

const std::vector<Octave>& TerrainGenerator::getOctaves() const {
    return octaves;
}

} // namespace generation
} // namespace blockworld
