#ifndef POOLSHOT_WALL_COLLISION_HPP
#define POOLSHOT_WALL_COLLISION_HPP

#include "poolshot/math/vector_math.hpp"

/** Outcome of resolving one proposed step against the four rails */
struct WallCollision {
    bool collided = false;
    bool hitVertical = false;    ///< left or right rail, vx reflected
    bool hitHorizontal = false;  ///< top or bottom rail, vy reflected
    Position point;              ///< contact point, or the proposed point
    Vector velocity;             ///< reflected velocity, magnitude unchanged
};

/**
 * @brief Clamps a proposed step to the playing surface and reflects velocity.
 *
 * The x and y axes are checked independently so a corner approach flips
 * both components in one call. No restitution or friction is applied and
 * no state is kept. Extents of 2 * radius or less are not supported.
 *
 * @param current Ball centre before the step
 * @param proposed Ball centre after an unobstructed step
 * @param velocity Velocity during the step
 * @param width Playing surface width
 * @param height Playing surface height
 * @param radius Ball radius
 */
WallCollision resolveWallStep(const Position &current, const Position &proposed,
                              const Vector &velocity, double width, double height,
                              double radius);

#endif
