/**
 * @file launch_request.hpp
 * @brief Input and output values of a trajectory simulation.
 */

#ifndef POOLSHOT_LAUNCH_REQUEST_HPP
#define POOLSHOT_LAUNCH_REQUEST_HPP

#include <cstddef>
#include <vector>

#include "poolshot/core/constants.hpp"
#include "poolshot/math/vector_math.hpp"

namespace Trajectory {

/// Ordered ball positions, first element is the launch origin.
using Path = std::vector<Position>;

/**
 * @struct LaunchRequest
 * @brief One shot as aimed by the player.
 *
 * Coordinates are playing-surface local (rails excluded), origin at the
 * top-left corner with y growing downward.
 */
struct LaunchRequest {
    Position origin;
    double angleInDegrees = 0.0;   ///< 0 along +x, positive clockwise on screen
    double force = 0.0;            ///< caller-defined scale, must be > 0
    double tableWidth = 0.0;
    double tableHeight = 0.0;
    int maxBounces = SimulatorConstants::DefaultMaxBounces;
};

/**
 * @brief Why a simulation stopped.
 */
enum class StopReason {
    InvalidInput,           ///< non-positive force or non-finite angle, empty path
    BounceBudgetExhausted,
    PointCapReached,
    VelocityDecayed
};

/**
 * @struct SimulationResult
 * @brief Path plus the simulator's own record of true rail contacts.
 *
 * contactIndices are the indices into path of recorded contact points.
 * A contact on the step that stops the ball is counted in bounces but has
 * no index since its point is never appended.
 */
struct SimulationResult {
    Path path;
    std::vector<std::size_t> contactIndices;
    int bounces = 0;
    StopReason termination = StopReason::InvalidInput;
};

const char* toString(StopReason reason);

} // namespace Trajectory

#endif // POOLSHOT_LAUNCH_REQUEST_HPP
