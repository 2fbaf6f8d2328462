#pragma once

#include <string>
#include <cstdint>

namespace blockworld {
namespace util {

/**
 * Configuration for a world session
 */
class Config {
public:
    Config();

    // World parameters
    int64_t seed;                      // Seed for terrain generation, fixed per world
    int worldHeight;                   // Vertical span of every chunk in blocks

    // Terrain generation parameters
    int maxTerrainHeight;              // Upper bound passed to the height generator
    int seaLevel;                      // Water fills air below this height, 0 disables

    // Streaming parameters
    int viewDistance;                  // Chunks generated around the player
    int numThreads;                    // Number of worker threads

    // Set when --help was requested
    bool helpRequested;

    /**
     * Parse command line arguments
     * @return False on an unknown option, a missing or malformed value, or --help
     */
    bool parseArguments(int argc, char* argv[]);

    /**
     * Check that the values describe a usable world, reporting problems on stderr
     * @return True if the configuration is valid
     */
    bool validate() const;

    void printHelp() const;
};

} // namespace util
} // namespace blockworld
