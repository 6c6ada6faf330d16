/**
 * @file physics_config.hpp
 * @brief Process-wide physics tuning shared by every trajectory simulation.
 */

#pragma once

/**
 * @struct PhysicsConfig
 * @brief Holds all physics parameters for trajectory prediction.
 *
 * The values are read-only once a simulator is built from them. Stopping
 * distance and bounce count for a given force depend on all of them
 * jointly, so they always travel together.
 */
struct PhysicsConfig {
    double ballRadius;         ///< table units
    double friction;           ///< velocity multiplier applied once per step, 0 < friction < 1
    double minVelocity;        ///< speed below which the ball is considered stopped
    double timeStep;           ///< integration granularity
    int maxPoints;             ///< hard cap on path length
    double velocityScale;      ///< maps force onto initial speed
    double bounceRestitution;  ///< fraction of velocity kept after a rail bounce

    /**
     * @brief Shipped tuning for the guide line
     */
    static PhysicsConfig defaults();
};

/**
 * @brief Checks that every parameter is finite and in range.
 *
 * @param cfg Configuration to check
 * @throws std::invalid_argument naming the first offending field
 */
void validatePhysicsConfig(const PhysicsConfig& cfg);
