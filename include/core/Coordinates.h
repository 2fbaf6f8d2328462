#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace blockworld {
namespace core {

// Block identifier, 0 is air
using BlockId = uint8_t;

constexpr BlockId AIR = 0;

// Horizontal span of a chunk in blocks
constexpr int CHUNK_SIZE = 16;

// Allowed range for the per-world vertical span
constexpr int MIN_WORLD_HEIGHT = 32;
constexpr int MAX_WORLD_HEIGHT = 256;

/**
 * Position of a chunk in chunk space. Chunks span the full world height,
 * so there is no vertical component.
 */
struct ChunkCoord {
    int cx = 0;
    int cz = 0;

    ChunkCoord() = default;
    ChunkCoord(int cx, int cz) : cx(cx), cz(cz) {}

    bool operator==(const ChunkCoord& other) const {
        return cx == other.cx && cz == other.cz;
    }

    bool operator!=(const ChunkCoord& other) const {
        return !(*this == other);
    }

    struct Hash {
        std::size_t operator()(const ChunkCoord& c) const {
            // Pack both halves into one 64-bit key so distinct pairs never collide before hashing
            uint64_t key = (static_cast<uint64_t>(static_cast<uint32_t>(c.cx)) << 32)
                         | static_cast<uint32_t>(c.cz);
            return std::hash<uint64_t>{}(key);
        }
    };
};

/**
 * Local coordinate of a world coordinate inside its chunk, always in [0, CHUNK_SIZE)
 */
inline int localCoord(int worldCoord) {
    return ((worldCoord % CHUNK_SIZE) + CHUNK_SIZE) % CHUNK_SIZE;
}

/**
 * Chunk coordinate containing a world coordinate, floor(worldCoord / CHUNK_SIZE)
 */
inline int chunkCoord(int worldCoord) {
    // worldCoord - local is an exact multiple of CHUNK_SIZE, so this division never truncates
    return (worldCoord - localCoord(worldCoord)) / CHUNK_SIZE;
}

inline ChunkCoord chunkCoordOf(int worldX, int worldZ) {
    return ChunkCoord(chunkCoord(worldX), chunkCoord(worldZ));
}

// Chunk coordinates whose blocks are all addressable with int world coordinates
constexpr int MIN_CHUNK_COORD = -(1 << 27);
constexpr int MAX_CHUNK_COORD = (1 << 27) - 1;

inline bool isValidChunkCoord(int cx, int cz) {
    return cx >= MIN_CHUNK_COORD && cx <= MAX_CHUNK_COORD
        && cz >= MIN_CHUNK_COORD && cz <= MAX_CHUNK_COORD;
}

// World coordinate of a chunk's origin along one axis
inline int64_t chunkOrigin(int chunk) {
    return static_cast<int64_t>(chunk) * CHUNK_SIZE;
}

// Number of cells in a chunk of the given height
inline std::size_t chunkVolume(int worldHeight) {
    return static_cast<std::size_t>(CHUNK_SIZE) * CHUNK_SIZE * static_cast<std::size_t>(worldHeight);
}

// Linear index of a local position; callers check bounds first
inline std::size_t blockIndex(int lx, int y, int lz) {
    return static_cast<std::size_t>(lx)
         + static_cast<std::size_t>(lz) * CHUNK_SIZE
         + static_cast<std::size_t>(y) * CHUNK_SIZE * CHUNK_SIZE;
}

} // namespace core
} // namespace blockworld
