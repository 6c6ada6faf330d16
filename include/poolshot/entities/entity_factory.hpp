#pragma once

#include <entt/entt.hpp>
#include "poolshot/components/basic.hpp"

namespace Entities {

/**
 * Factory for the entities a trajectory simulation runs on.
 */
class EntityFactory {
public:
    /**
     * Creates the cue ball with everything the step systems need.
     *
     * @param registry The entity registry
     * @param position Launch position
     * @param velocity Initial velocity
     * @param radius Ball radius
     * @param maxBounces Rail contacts allowed before the path ends
     * @return The created entity
     */
    static entt::entity createCueBall(
        entt::registry& registry,
        const Components::Position& position,
        const Components::Velocity& velocity,
        double radius,
        int maxBounces
    );

    /**
     * Creates the entity carrying the playing surface extents.
     */
    static entt::entity createTable(entt::registry& registry, double width, double height);
};

} // namespace Entities
