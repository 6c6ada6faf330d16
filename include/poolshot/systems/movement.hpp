/**
 * @file movement.hpp
 * @brief System for proposing the next ball position from its velocity
 *
 * This system handles:
 * - Proposing position + velocity * timeStep for every moving ball
 *
 * Required components:
 * - Position (to read)
 * - Velocity (to read)
 * - ProposedPosition (to write)
 *
 * The proposal is committed (or corrected) by the BoundarySystem.
 */

#ifndef POOLSHOT_MOVEMENT_SYSTEM_HPP
#define POOLSHOT_MOVEMENT_SYSTEM_HPP

#include <entt/entt.hpp>
#include "poolshot/systems/i_system.hpp"

namespace Systems {

/**
 * @class MovementSystem
 * @brief Integrates one fixed time step without looking at the rails
 */
class MovementSystem : public ISystem {
public:
    MovementSystem();
    ~MovementSystem() override = default;

    /**
     * @brief Writes the unobstructed next position of every ball
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry &registry) override;

    void setPhysicsConfig(const PhysicsConfig& config) override;

private:
    PhysicsConfig physicsConfig;
};

} // namespace Systems

#endif
