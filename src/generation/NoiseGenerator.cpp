#include "generation/NoiseGenerator.h"
#include <algorithm>
#include <cmath>

namespace blockworld {
namespace generation {

namespace {

const double F2 = 0.5 * (std::sqrt(3.0) - 1.0);
const double G2 = (3.0 - std::sqrt(3.0)) / 6.0;

// 12 gradient directions, (x, z) pairs
const double GRADIENTS[12][2] = {
    { 1,  1}, {-1,  1}, { 1, -1}, {-1, -1},
    { 1,  0}, {-1,  0}, { 1,  0}, {-1,  0},
    { 0,  1}, { 0, -1}, { 0,  1}, { 0, -1}
};

// Lattice coordinate modulo 256, computed in floating point so huge inputs never overflow an int
inline int wrapLattice(double cell) {
    const double wrapped = cell - 256.0 * std::floor(cell / 256.0);
    return std::clamp(static_cast<int>(wrapped), 0, 255);
}

} // namespace

uint32_t SeedRandom::nextUint() {
    state += 0x6D2B79F5u;
    uint32_t t = state;
    t = (t ^ (t >> 15)) * (t | 1u);
    t ^= t + (t ^ (t >> 7)) * (t | 61u);
    return t ^ (t >> 14);
}

double SeedRandom::next() {
    return nextUint() / 4294967296.0;
}

uint32_t SeedRandom::foldSeed(int64_t seed) {
    const uint64_t bits = static_cast<uint64_t>(seed);
    return static_cast<uint32_t>(bits) ^ static_cast<uint32_t>(bits >> 32);
}

NoiseGenerator::NoiseGenerator(int64_t seed) : seed(seed) {
    initPermutationTable();
}

void NoiseGenerator::initPermutationTable() {
    SeedRandom rng(SeedRandom::foldSeed(seed));

    for (int i = 0; i < 256; i++) {
        perm[i] = static_cast<uint8_t>(i);
    }

    // Fisher-Yates shuffle driven by the seeded source
    for (int i = 0; i < 255; i++) {
        const int r = i + static_cast<int>(rng.next() * (256 - i));
        std::swap(perm[i], perm[r]);
    }

    for (int i = 0; i < 256; i++) {
        perm[i + 256] = perm[i]; // Duplicate for easy indexing
    }

    for (int i = 0; i < 512; i++) {
        const double* g = GRADIENTS[perm[i] % 12];
        permGradX[i] = g[0];
        permGradZ[i] = g[1];
    }
}

double NoiseGenerator::simplex2D(double x, double z) const {
    // Skew the input space to find the simplex cell
    const double s = (x + z) * F2;
    const double i = std::floor(x + s);
    const double j = std::floor(z + s);

    // Unskew the cell origin back to (x, z) space
    const double t = (i + j) * G2;
    const double x0 = x - (i - t);
    const double z0 = z - (j - t);

    // Which of the two triangles of the cell we are in
    const int i1 = x0 > z0 ? 1 : 0;
    const int j1 = x0 > z0 ? 0 : 1;

    const double x1 = x0 - i1 + G2;
    const double z1 = z0 - j1 + G2;
    const double x2 = x0 - 1.0 + 2.0 * G2;
    const double z2 = z0 - 1.0 + 2.0 * G2;

    const int ii = wrapLattice(i);
    const int jj = wrapLattice(j);

    // Contribution of each of the three corners
    double n0 = 0.0;
    double n1 = 0.0;
    double n2 = 0.0;

    double t0 = 0.5 - x0 * x0 - z0 * z0;
    if (t0 >= 0) {
        const int gi0 = ii + perm[jj];
        t0 *= t0;
        n0 = t0 * t0 * (permGradX[gi0] * x0 + permGradZ[gi0] * z0);
    }

    double t1 = 0.5 - x1 * x1 - z1 * z1;
    if (t1 >= 0) {
        const int gi1 = ii + i1 + perm[jj + j1];
        t1 *= t1;
        n1 = t1 * t1 * (permGradX[gi1] * x1 + permGradZ[gi1] * z1);
    }

    double t2 = 0.5 - x2 * x2 - z2 * z2;
    if (t2 >= 0) {
        const int gi2 = ii + 1 + perm[jj + 1];
        t2 *= t2;
        n2 = t2 * t2 * (permGradX[gi2] * x2 + permGradZ[gi2] * z2);
    }

    // Scale to [-1, 1]
    return 70.0 * (n0 + n1 + n2);
}

double NoiseGenerator::sample(double x, double z) const {
    const double value = (simplex2D(x, z) + 1.0) * 0.5;
    return std::clamp(value, 0.0, 1.0);
}

int64_t NoiseGenerator::getSeed() const {
    return seed;
}

} // namespace generation
} // namespace blockworld
