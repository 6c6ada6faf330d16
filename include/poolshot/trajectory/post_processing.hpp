/**
 * @file post_processing.hpp
 * @brief Display helpers that work on an already computed Path
 */

#ifndef POOLSHOT_POST_PROCESSING_HPP
#define POOLSHOT_POST_PROCESSING_HPP

#include "poolshot/core/constants.hpp"
#include "poolshot/core/launch_request.hpp"

namespace Trajectory {

/**
 * @brief Interior path points where the direction turns sharply
 *
 * For each interior point the bearings of the incoming and outgoing
 * segments are compared; the absolute difference, folded into [0, 180],
 * must exceed angleThreshold. This is a geometric approximation for
 * drawing bounce markers. It can disagree with
 * SimulationResult::contactIndices in both directions.
 *
 * @param path Path in temporal order
 * @param angleThreshold Minimum turn in degrees
 * @return Marked points in path order, empty for paths shorter than 3
 */
Path extractBouncePoints(const Path& path,
                         double angleThreshold = SimulatorConstants::DefaultBounceAngleThreshold);

/**
 * @brief Thins a path to roughly even spacing
 *
 * Keeps the first point, then every point at least spacing away from the
 * last kept one, and always the final point. Paths of two points or fewer
 * are returned unchanged.
 */
Path smoothTrajectory(const Path& path,
                      double spacing = SimulatorConstants::DefaultSmoothingSpacing);

} // namespace Trajectory

#endif // POOLSHOT_POST_PROCESSING_HPP
