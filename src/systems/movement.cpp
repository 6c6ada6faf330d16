#include "poolshot/systems/movement.hpp"
#include "poolshot/components/basic.hpp"
#include "poolshot/core/profile.hpp"

namespace Systems {

MovementSystem::MovementSystem() : physicsConfig(PhysicsConfig::defaults()) {}

void MovementSystem::setPhysicsConfig(const PhysicsConfig& config) {
    physicsConfig = config;
}

void MovementSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("MovementSystem");

    double const dt = physicsConfig.timeStep;

    auto view = registry.view<Components::Position, Components::Velocity, Components::ProposedPosition>();

    for (auto &&[entity, pos, vel, proposed] : view.each()) {
        proposed.value = pos + vel * dt;
    }
}

} // namespace Systems
