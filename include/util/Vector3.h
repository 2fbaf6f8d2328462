#pragma once

#include <cmath>
#include <limits>

namespace blockworld {
namespace util {

/**
 * Integer 3D vector used for block positions in world coordinates
 */
class Vector3 {
public:
    int x, y, z;

    Vector3() : x(0), y(0), z(0) {}
    Vector3(int x, int y, int z) : x(x), y(y), z(z) {}

    bool operator==(const Vector3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
};

/**
 * Floating point position, used for the player
 */
struct Vector3f {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    Vector3f() = default;
    Vector3f(float x, float y, float z) : x(x), y(y), z(z) {}

    /**
     * Block that contains this position. Components beyond the int range
     * saturate at its limits, NaN maps to 0.
     */
    Vector3 toBlock() const {
        return Vector3(floorToInt(x), floorToInt(y), floorToInt(z));
    }

    bool operator==(const Vector3f& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

private:
    static int floorToInt(float value) {
        if (std::isnan(value)) {
            return 0;
        }

        const double floored = std::floor(static_cast<double>(value));
        if (floored <= static_cast<double>(std::numeric_limits<int>::min())) {
            return std::numeric_limits<int>::min();
        }
        if (floored >= static_cast<double>(std::numeric_limits<int>::max())) {
            return std::numeric_limits<int>::max();
        }
        return static_cast<int>(floored);
    }
};

} // namespace util
} // namespace blockworld
