/**
 * @file trajectory_simulator.hpp
 * @brief Predicts the path of a single ball launched across the table.
 */

#pragma once

#include <memory>
#include <vector>

#include <entt/entt.hpp>

#include "poolshot/core/launch_request.hpp"
#include "poolshot/core/physics_config.hpp"
#include "poolshot/systems/i_system.hpp"

namespace Trajectory {

/**
 * @class TrajectorySimulator
 * @brief Runs the fixed-step integrator for one launch at a time.
 *
 * Each call builds its own registry holding the ball and the table, then
 * ticks the movement, boundary and dampening systems until the ball runs
 * out of bounce budget, hits the point cap, or slows below minVelocity.
 * The point that triggers the slow-down stop is not appended, so the last
 * path point is the last one still above the threshold.
 *
 * The simulator itself is immutable after construction; concurrent calls
 * share nothing but the configuration.
 */
class TrajectorySimulator {
public:
    /**
     * @brief Builds a simulator with the shipped tuning
     */
    TrajectorySimulator();

    /**
     * @brief Builds a simulator with custom tuning
     * @throws std::invalid_argument if the configuration is out of range
     */
    explicit TrajectorySimulator(const PhysicsConfig& config);

    ~TrajectorySimulator();

    TrajectorySimulator(const TrajectorySimulator&) = delete;
    TrajectorySimulator& operator=(const TrajectorySimulator&) = delete;

    /**
     * @brief Predicted positions for a launch
     *
     * Empty when force is not a positive finite number or the angle is not
     * finite.
     */
    Path simulate(const LaunchRequest& request) const;

    /**
     * @brief Predicted positions together with the true rail contacts
     */
    SimulationResult simulateDetailed(const LaunchRequest& request) const;

    const PhysicsConfig& getConfig() const { return config; }

private:
    PhysicsConfig config;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;

    void createSystems();
    void tick(entt::registry& registry) const;
};

/**
 * @brief One-off prediction without keeping a simulator around
 */
Path getPredictedPath(const LaunchRequest& request,
                      const PhysicsConfig& config = PhysicsConfig::defaults());

} // namespace Trajectory
