#include "poolshot/math/geometry.hpp"
#include "poolshot/math/constants.hpp"

#include <cmath>

namespace Geometry {

double angleBetweenPoints(const Position& a, const Position& b) {
    double const angle = (b - a).bearingDegrees();
    // atan2 yields -180 for a negative-zero dy; fold onto the closed end
    return angle == -180.0 ? 180.0 : angle;
}

double distanceBetween(const Position& a, const Position& b) {
    return a.dist(b);
}

double normalizeAngle(double degrees) {
    double normalized = std::fmod(degrees, 360.0);
    if (normalized < 0) {
        normalized += 360.0;
    }
    // tiny negative inputs round up to exactly 360 after the shift
    if (normalized >= 360.0) {
        normalized = 0.0;
    }
    return normalized;
}

double degreesToRadians(double degrees) {
    return degrees * MathConstants::RAD_PER_DEG;
}

double radiansToDegrees(double radians) {
    return radians * MathConstants::DEG_PER_RAD;
}

double reflectionAngle(double incidentDegrees, WallOrientation wall) {
    if (wall == WallOrientation::Horizontal) {
        return -incidentDegrees;
    }
    return 180.0 - incidentDegrees;
}

} // namespace Geometry
