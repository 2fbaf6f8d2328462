#include "util/Config.h"
#include <algorithm>
#include <iostream>
#include <cstring>
#include <limits>
#include <ctime>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace blockworld {
namespace util {

Config::Config() {
    // Set defaults
    seed = static_cast<int64_t>(std::time(nullptr));
    worldHeight = 32;

    maxTerrainHeight = 24;
    seaLevel = 8;

    viewDistance = 3;
    unsigned int cores = std::thread::hardware_concurrency();
    numThreads = static_cast<int>(std::max(1u, cores > 1 ? cores - 1 : 1u));

    helpRequested = false;
}

bool Config::parseArguments(int argc, char* argv[]) {
    // Reads the value following option i into out
    auto readValue = [&](int& i, const char* name, auto& out) -> bool {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << name << std::endl;
            return false;
        }

        const char* text = argv[++i];
        try {
            size_t consumed = 0;
            long long value = std::stoll(text, &consumed);
            if (consumed != std::strlen(text)) {
                throw std::invalid_argument(text);
            }
            using Target = std::remove_reference_t<decltype(out)>;
            if (value < static_cast<long long>(std::numeric_limits<Target>::min())
                || value > static_cast<long long>(std::numeric_limits<Target>::max())) {
                std::cerr << "Value for " << name << " is out of range: " << text << std::endl;
                return false;
            }
            out = static_cast<Target>(value);
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << name << ": " << text << std::endl;
            return false;
        }
        return true;
    };

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            helpRequested = true;
            printHelp();
            return false;
        } else if (strcmp(argv[i], "--seed") == 0 || strcmp(argv[i], "-s") == 0) {
            if (!readValue(i, "seed", seed)) return false;
        } else if (strcmp(argv[i], "--world-height") == 0 || strcmp(argv[i], "-wh") == 0) {
            if (!readValue(i, "world height", worldHeight)) return false;
        } else if (strcmp(argv[i], "--max-height") == 0 || strcmp(argv[i], "-mh") == 0) {
            if (!readValue(i, "max terrain height", maxTerrainHeight)) return false;
        } else if (strcmp(argv[i], "--sea-level") == 0 || strcmp(argv[i], "-sl") == 0) {
            if (!readValue(i, "sea level", seaLevel)) return false;
        } else if (strcmp(argv[i], "--view-distance") == 0 || strcmp(argv[i], "-vd") == 0) {
            if (!readValue(i, "view distance", viewDistance)) return false;
        } else if (strcmp(argv[i], "--threads") == 0 || strcmp(argv[i], "-t") == 0) {
            if (!readValue(i, "threads", numThreads)) return false;
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            return false;
        }
    }

    return true;
}

bool Config::validate() const {
    bool valid = true;

    if (worldHeight < 32 || worldHeight > 256) {
        std::cerr << "World height must be between 32 and 256, got " << worldHeight << std::endl;
        valid = false;
    }
    if (maxTerrainHeight < 0 || maxTerrainHeight > worldHeight) {
        std::cerr << "Max terrain height must be between 0 and the world height, got "
                  << maxTerrainHeight << std::endl;
        valid = false;
    }
    if (seaLevel >= worldHeight) {
        std::cerr << "Sea level must be below the world height, got " << seaLevel << std::endl;
        valid = false;
    }
    if (viewDistance < 0) {
        std::cerr << "View distance must not be negative, got " << viewDistance << std::endl;
        valid = false;
    }
    if (numThreads < 1) {
        std::cerr << "At least one worker thread is required, got " << numThreads << std::endl;
        valid = false;
    }

    return valid;
}

void Config::printHelp() const {
    std::cout << "blockworld: chunked voxel world store and terrain generator" << std::endl;
    std::cout << "Usage: blockworld [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help                 Show this help message" << std::endl;
    std::cout << "  -s, --seed <value>         Set the world seed (default: current time)" << std::endl;
    std::cout << "  -wh, --world-height <n>    Set the world height, 32-256 (default: 32)" << std::endl;
    std::cout << "  -mh, --max-height <n>      Set the maximum terrain height (default: 24)" << std::endl;
    std::cout << "  -sl, --sea-level <n>       Set the sea level, 0 disables water (default: 8)" << std::endl;
    std::cout << "  -vd, --view-distance <n>   Set the view distance in chunks (default: 3)" << std::endl;
    std::cout << "  -t, --threads <n>          Set the number of worker threads (default: cores-1)" << std::endl;
}

} // namespace util
} // namespace blockworld
