/**
 * @fileoverview trajectory_simulator.cpp
 * @brief Implementation of TrajectorySimulator.
 */

#include "poolshot/core/trajectory_simulator.hpp"

#include <cmath>

#include "poolshot/components/basic.hpp"
#include "poolshot/core/debug.hpp"
#include "poolshot/core/profile.hpp"
#include "poolshot/entities/entity_factory.hpp"
#include "poolshot/math/constants.hpp"
#include "poolshot/systems/boundary.hpp"
#include "poolshot/systems/dampening.hpp"
#include "poolshot/systems/movement.hpp"

namespace Trajectory {

TrajectorySimulator::TrajectorySimulator() : TrajectorySimulator(PhysicsConfig::defaults()) {}

TrajectorySimulator::TrajectorySimulator(const PhysicsConfig& cfg) : config(cfg) {
  validatePhysicsConfig(config);
  createSystems();
}

TrajectorySimulator::~TrajectorySimulator() = default;

void TrajectorySimulator::createSystems() {
  systems.clear();

  // Order matters: friction always follows the bounce restitution of the same step
  systems.push_back(std::make_unique<Systems::MovementSystem>());
  systems.push_back(std::make_unique<Systems::BoundarySystem>());
  systems.push_back(std::make_unique<Systems::DampeningSystem>());

  for (auto& system : systems) {
    system->setPhysicsConfig(config);
  }
}

void TrajectorySimulator::tick(entt::registry& registry) const {
  for (const auto& system : systems) {
    system->update(registry);
  }
}

Path TrajectorySimulator::simulate(const LaunchRequest& request) const {
  return simulateDetailed(request).path;
}

SimulationResult TrajectorySimulator::simulateDetailed(const LaunchRequest& request) const {
  PROFILE_SCOPE("TrajectorySimulator::simulate");

  SimulationResult result;

  if (!std::isfinite(request.force) || request.force <= 0 ||
      !std::isfinite(request.angleInDegrees)) {
    result.termination = StopReason::InvalidInput;
    return result;
  }

  double const angleRad = request.angleInDegrees * MathConstants::RAD_PER_DEG;
  Vector const initialVelocity(std::cos(angleRad) * request.force * config.velocityScale,
                               std::sin(angleRad) * request.force * config.velocityScale);

  entt::registry registry;
  Entities::EntityFactory::createTable(registry, request.tableWidth, request.tableHeight);
  auto ball = Entities::EntityFactory::createCueBall(registry, request.origin, initialVelocity,
                                                     config.ballRadius, request.maxBounces);

  const auto& pos = registry.get<Components::Position>(ball);
  const auto& vel = registry.get<Components::Velocity>(ball);
  const auto& contacts = registry.get<Components::WallContacts>(ball);

  const auto maxPoints = static_cast<std::size_t>(config.maxPoints);
  result.path.reserve(maxPoints);
  result.path.push_back(request.origin);

  // Counts ticks as well as points so a step that lands on the previous point
  // still advances toward the cap.
  std::size_t steps = 1;

  while (true) {
    if (request.maxBounces > 0 && contacts.bounces >= request.maxBounces) {
      result.termination = StopReason::BounceBudgetExhausted;
      break;
    }
    if (steps >= maxPoints) {
      result.termination = StopReason::PointCapReached;
      break;
    }

    tick(registry);
    ++steps;

    if (contacts.blockedByBudget) {
      result.termination = StopReason::BounceBudgetExhausted;
      break;
    }
    if (vel.length() < config.minVelocity) {
      result.termination = StopReason::VelocityDecayed;
      break;
    }

    // A ball launched against a rail clamps back onto its start point.
    // The contact is kept on the existing point instead of repeating it.
    if (!(pos == result.path.back())) {
      result.path.push_back(pos);
    }
    if (contacts.collidedThisStep) {
      std::size_t const index = result.path.size() - 1;
      if (result.contactIndices.empty() || result.contactIndices.back() != index) {
        result.contactIndices.push_back(index);
      }
    }
  }

  result.bounces = contacts.bounces;

  DEBUG_MSG(DEBUG_LEVEL_VERBOSE,
      "TrajectorySimulator: " << result.path.size() << " points, "
      << result.bounces << " bounces, stopped by " << toString(result.termination) << "\n");

  return result;
}

Path getPredictedPath(const LaunchRequest& request, const PhysicsConfig& config) {
  TrajectorySimulator const simulator(config);
  return simulator.simulate(request);
}

} // namespace Trajectory
