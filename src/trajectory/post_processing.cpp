#include "poolshot/trajectory/post_processing.hpp"
#include "poolshot/math/geometry.hpp"

#include <cmath>

namespace Trajectory {

Path extractBouncePoints(const Path& path, double angleThreshold) {
    Path bouncePoints;
    if (path.size() < 3) {
        return bouncePoints;
    }

    for (std::size_t i = 1; i + 1 < path.size(); ++i) {
        double const incoming = Geometry::angleBetweenPoints(path[i - 1], path[i]);
        double const outgoing = Geometry::angleBetweenPoints(path[i], path[i + 1]);

        double angleDiff = std::abs(incoming - outgoing);
        if (angleDiff > 180.0) {
            angleDiff = 360.0 - angleDiff;
        }

        if (angleDiff > angleThreshold) {
            bouncePoints.push_back(path[i]);
        }
    }

    return bouncePoints;
}

Path smoothTrajectory(const Path& path, double spacing) {
    if (path.size() <= 2) {
        return path;
    }

    Path smoothed;
    smoothed.push_back(path.front());
    std::size_t lastKept = 0;

    for (std::size_t i = 1; i < path.size(); ++i) {
        bool const isLast = (i == path.size() - 1);
        if (isLast || Geometry::distanceBetween(path[lastKept], path[i]) >= spacing) {
            smoothed.push_back(path[i]);
            lastKept = i;
        }
    }

    return smoothed;
}

} // namespace Trajectory
