/**
 * @file dampening.hpp
 * @brief System for applying rolling friction to the ball
 *
 * Multiplies every ball's velocity by the friction factor once per step,
 * after any bounce restitution of the same step.
 *
 * Required components:
 * - Velocity (to apply linear damping)
 */

#ifndef POOLSHOT_DAMPENING_SYSTEM_HPP
#define POOLSHOT_DAMPENING_SYSTEM_HPP

#include <entt/entt.hpp>
#include "poolshot/systems/i_system.hpp"

namespace Systems {

/**
 * @class DampeningSystem
 * @brief Dampens linear velocity
 */
class DampeningSystem : public ISystem {
public:
    DampeningSystem();
    ~DampeningSystem() override = default;

    /**
     * @brief Applies velocity damping
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry &registry) override;

    void setPhysicsConfig(const PhysicsConfig& config) override;

private:
    PhysicsConfig physicsConfig;
};

} // namespace Systems

#endif
