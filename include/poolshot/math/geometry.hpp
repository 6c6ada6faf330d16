/**
 * @file geometry.hpp
 * @brief Stateless angle and distance helpers for table-local points
 *
 * All angles are in degrees unless the name says otherwise. Bearings follow
 * screen convention: 0 along +x, positive clockwise because y grows downward.
 */

#ifndef POOLSHOT_GEOMETRY_HPP
#define POOLSHOT_GEOMETRY_HPP

#include "poolshot/math/vector_math.hpp"

namespace Geometry {

/**
 * @brief Wall orientation used by reflectionAngle
 */
enum class WallOrientation {
    Horizontal, ///< top or bottom rail (normal along y)
    Vertical    ///< left or right rail (normal along x)
};

/**
 * @brief Bearing of the segment from a to b
 * @return Degrees in (-180, 180]
 */
double angleBetweenPoints(const Position& a, const Position& b);

/**
 * @brief Euclidean distance between two points
 */
double distanceBetween(const Position& a, const Position& b);

/**
 * @brief Wraps an angle into [0, 360)
 */
double normalizeAngle(double degrees);

double degreesToRadians(double degrees);
double radiansToDegrees(double radians);

/**
 * @brief Outgoing bearing of a mirror reflection off a straight rail
 *
 * Horizontal rails mirror the bearing about the x axis (-incident),
 * vertical rails about the y axis (180 - incident). The result is not
 * normalized.
 *
 * @param incidentDegrees Incoming bearing
 * @param wall Which kind of rail is hit
 * @return Outgoing bearing in degrees
 */
double reflectionAngle(double incidentDegrees, WallOrientation wall);

} // namespace Geometry

#endif // POOLSHOT_GEOMETRY_HPP
