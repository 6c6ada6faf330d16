/**
 * @file boundary.hpp
 * @brief System for handling rail collisions of the ball
 *
 * This system handles:
 * - Resolving each proposed step against the table rails
 * - Committing the contact point or the proposed point as the new position
 * - Applying the bounce restitution factor on contact steps
 * - Counting rail contacts against the bounce budget
 *
 * Required components:
 * - Position (to modify)
 * - Velocity (to modify)
 * - ProposedPosition (to read)
 * - Radius (to read)
 * - WallContacts (to modify)
 *
 * The table extents come from the entity holding TableBounds.
 */

#ifndef POOLSHOT_BOUNDARY_SYSTEM_HPP
#define POOLSHOT_BOUNDARY_SYSTEM_HPP

#include <entt/entt.hpp>
#include "poolshot/systems/i_system.hpp"

namespace Systems {

/**
 * @class BoundarySystem
 * @brief Commits proposed steps, reflecting off the rails
 *
 * When the budget is zero a contact is not applied: the ball keeps its
 * pre-step position and velocity and is flagged blockedByBudget.
 */
class BoundarySystem : public ISystem {
public:
    BoundarySystem();
    ~BoundarySystem() override = default;

    /**
     * @brief Resolves rail contacts for every ball
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry &registry) override;

    void setPhysicsConfig(const PhysicsConfig& config) override;

private:
    PhysicsConfig physicsConfig;
};

} // namespace Systems

#endif
