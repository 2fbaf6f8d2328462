#pragma once

#include <cstdint>
#include <array>

namespace blockworld {
namespace generation {

/**
 * Small-state seeded random source (mulberry32). Used only to build the
 * noise permutation table so that a seed always yields the same terrain.
 */
class SeedRandom {
public:
    explicit SeedRandom(uint32_t state) : state(state) {}

    // Next raw 32-bit output
    uint32_t nextUint();

    // Next value in [0, 1)
    double next();

    // Fold a 64-bit world seed into the 32-bit generator state
    static uint32_t foldSeed(int64_t seed);

private:
    uint32_t state;
};

/**
 * Seeded 2D simplex noise for terrain generation
 */
class NoiseGenerator {
public:
    /**
     * Constructor
     * @param seed World seed for the noise generator
     */
    explicit NoiseGenerator(int64_t seed);

    /**
     * Raw 2D simplex noise
     * @param x X coordinate
     * @param z Z coordinate
     * @return Noise value in the range [-1, 1]
     */
    double simplex2D(double x, double z) const;

    /**
     * Base terrain noise
     * @param x X coordinate
     * @param z Z coordinate
     * @return simplex2D remapped to the range [0, 1]
     */
    double sample(double x, double z) const;

    int64_t getSeed() const;

private:
    int64_t seed;

    // Permutation table, duplicated so corner lookups never wrap
    std::array<uint8_t, 512> perm;

    // Gradient components pre-resolved per permutation entry
    std::array<double, 512> permGradX;
    std::array<double, 512> permGradZ;

    void initPermutationTable();
};

} // namespace generation
} // namespace blockworld
