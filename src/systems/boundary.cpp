#include "poolshot/systems/boundary.hpp"
#include "poolshot/algo/wall_collision.hpp"
#include "poolshot/components/basic.hpp"
#include "poolshot/core/profile.hpp"

namespace Systems {

BoundarySystem::BoundarySystem() : physicsConfig(PhysicsConfig::defaults()) {}

void BoundarySystem::setPhysicsConfig(const PhysicsConfig& config) {
    physicsConfig = config;
}

void BoundarySystem::update(entt::registry &registry) {
    PROFILE_SCOPE("BoundarySystem");

    auto tables = registry.view<Components::TableBounds>();
    if (tables.empty()) {
        return;
    }
    const auto &bounds = registry.get<Components::TableBounds>(tables.front());
    const double restitution = physicsConfig.bounceRestitution;

    auto view = registry.view<Components::Position, Components::Velocity,
                              Components::ProposedPosition, Components::Radius,
                              Components::WallContacts>();

    for (auto &&[entity, pos, vel, proposed, radius, contacts] : view.each()) {
        WallCollision const hit = resolveWallStep(pos, proposed.value, vel,
                                                  bounds.width, bounds.height, radius.value);
        contacts.collidedThisStep = hit.collided;

        if (!hit.collided) {
            pos = proposed.value;
            continue;
        }

        if (contacts.maxBounces <= 0) {
            contacts.blockedByBudget = true;
            continue;
        }

        pos = hit.point;
        vel = hit.velocity;
        vel *= restitution;
        contacts.bounces++;
    }
}

} // namespace Systems
