/**
 * @file dampening.cpp
 * @brief Implementation of velocity dampening system
 */

#include "poolshot/systems/dampening.hpp"
#include "poolshot/components/basic.hpp"
#include "poolshot/core/profile.hpp"

namespace Systems {

DampeningSystem::DampeningSystem() : physicsConfig(PhysicsConfig::defaults()) {}

void DampeningSystem::setPhysicsConfig(const PhysicsConfig& config) {
    physicsConfig = config;
}

void DampeningSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("DampeningSystem");

    const double friction = physicsConfig.friction;

    auto view = registry.view<Components::Velocity>();

    for (auto &&[entity, vel] : view.each()) {
        vel *= friction;
    }
}

} // namespace Systems
