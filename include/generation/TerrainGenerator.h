#pragma once

#include "generation/NoiseGenerator.h"
#include "core/Coordinates.h"
#include "util/Config.h"
#include <cstdint>
#include <vector>

namespace blockworld {
namespace generation {

// One noise layer of the height function
struct Octave {
    double amplitude;
    double frequency;
};

/**
 * Default octave stack: each layer doubles the frequency and halves the amplitude
 */
const std::vector<Octave>& defaultOctaves();

/**
 * Check an octave list: non-empty, positive amplitudes, strictly decreasing
 * amplitude and strictly increasing frequency
 * @throws std::invalid_argument describing the first violation
 */
void validateOctaves(const std::vector<Octave>& octaves);

/**
 * Create a reusable noise source for a seed
 */
NoiseGenerator createTerrainSource(int64_t seed);

/**
 * Terrain height at a world position
 * @param source Noise source from createTerrainSource
 * @param x X coordinate in world space
 * @param z Z coordinate in world space
 * @param maxHeight Maximum height, values <= 0 yield 0
 * @param octaves Octave stack to combine
 * @return Height in the range [0, maxHeight]
 */
double terrainHeight(const NoiseGenerator& source, double x, double z, double maxHeight,
                     const std::vector<Octave>& octaves = defaultOctaves());

/**
 * Generates terrain columns and whole chunks from a seed.
 * Immutable after construction, so worker threads can share one instance.
 */
class TerrainGenerator {
public:
    /**
     * Constructor
     * @param config Configuration providing seed, world height, max terrain height and sea level
     */
    explicit TerrainGenerator(const util::Config& config);

    /**
     * Constructor
     * @param seed World seed
     * @param worldHeight Height of every chunk in blocks
     * @param maxTerrainHeight Upper bound for terrainHeight
     * @param seaLevel Water fills air below this height, 0 disables water
     * @param octaves Octave stack, validated with validateOctaves
     */
    TerrainGenerator(int64_t seed, int worldHeight, int maxTerrainHeight, int seaLevel,
                     std::vector<Octave> octaves = defaultOctaves());

    /**
     * Terrain height at a world position using this generator's octaves
     */
    double terrainHeight(double x, double z, double maxHeight) const;

    /**
     * Number of solid blocks stacked in a world column
     * @return floor(terrainHeight(x, z, maxTerrainHeight)) clamped to [0, worldHeight]
     */
    int columnHeight(int64_t x, int64_t z) const;

    /**
     * Build the block data for a chunk
     * @param cx X coordinate of the chunk
     * @param cz Z coordinate of the chunk
     * @return Block ids in chunk index order, CHUNK_SIZE * CHUNK_SIZE * worldHeight long
     */
    std::vector<core::BlockId> populateChunk(int cx, int cz) const;

    const NoiseGenerator& getNoise() const;

    int64_t getSeed() const;

    int getWorldHeight() const;

    int getMaxTerrainHeight() const;

    int getSeaLevel() const;

    const std::vector<Octave>& getOctaves() const;

private:
    NoiseGenerator noise;

    std::vector<Octave> octaves;

    int worldHeight;
    int maxTerrainHeight;
    int seaLevel;

    // Block placed at height y in a column stacked h blocks high
    core::BlockId blockForColumn(int y, int h) const;
};

} // namespace generation
} // namespace blockworld
