/**
 * @file i_system.hpp
 * @brief Interface for the per-step ECS systems of the trajectory simulator
 */

#pragma once

#include <entt/entt.hpp>
#include "poolshot/core/physics_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 * 
 * Every system advances one part of a simulation step and reads its
 * tuning from the shared PhysicsConfig.
 */
class ISystem {
public:
    /**
     * @brief Virtual destructor for proper cleanup of derived classes
     */
    virtual ~ISystem() = default;
    
    /**
     * @brief Updates the system for one simulation step
     * 
     * @param registry EnTT registry containing all entities and components
     */
    virtual void update(entt::registry& registry) = 0;
    
    /**
     * @brief Sets the physics configuration
     * 
     * @param config Physics configuration parameters
     */
    virtual void setPhysicsConfig(const PhysicsConfig& config) = 0;
};

} // namespace Systems
