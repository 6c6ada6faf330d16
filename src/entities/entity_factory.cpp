#include "poolshot/entities/entity_factory.hpp"

namespace Entities {

entt::entity EntityFactory::createCueBall(entt::registry& registry,
                                          const Components::Position& position,
                                          const Components::Velocity& velocity,
                                          double radius,
                                          int maxBounces) {
    auto ball = registry.create();
    registry.emplace<Components::Position>(ball, position);
    registry.emplace<Components::Velocity>(ball, velocity);
    registry.emplace<Components::ProposedPosition>(ball, position);
    registry.emplace<Components::Radius>(ball, radius);

    auto &contacts = registry.emplace<Components::WallContacts>(ball);
    contacts.maxBounces = maxBounces;
    return ball;
}

entt::entity EntityFactory::createTable(entt::registry& registry, double width, double height) {
    auto table = registry.create();
    registry.emplace<Components::TableBounds>(table, width, height);
    return table;
}

} // namespace Entities
