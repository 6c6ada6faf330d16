/**
 * @fileoverview shot_predictor.cpp
 * @brief Implementation of ShotPredictor.
 */

#include "poolshot/core/shot_predictor.hpp"

#include <utility>

#include "poolshot/core/constants.hpp"
#include "poolshot/core/debug.hpp"
#include "poolshot/trajectory/post_processing.hpp"

namespace Trajectory {

ShotPredictor::ShotPredictor(const TrajectorySimulator& sim, const Position& ball,
                             double width, double height)
    : simulator(sim), cueBall(ball), tableWidth(width), tableHeight(height) {}

const GuidePrediction& ShotPredictor::update(double force, double angleInDegrees) {
  if (!(force > SimulatorConstants::MinimumGuideForce)) {
    clear();
    return prediction;
  }

  LaunchRequest request;
  request.origin = cueBall;
  request.angleInDegrees = angleInDegrees;
  request.force = force;
  request.tableWidth = tableWidth;
  request.tableHeight = tableHeight;
  request.maxBounces = SimulatorConstants::GuideLineMaxBounces;

  SimulationResult result = simulator.simulateDetailed(request);

  GuidePrediction next;
  next.bouncePoints = extractBouncePoints(result.path);
  if (!result.path.empty()) {
    next.endPoint = result.path.back();
  }
  next.contactCount = result.bounces;
  next.termination = result.termination;
  next.path = std::move(result.path);

  prediction = std::move(next);

  DEBUG_MSG(DEBUG_LEVEL_BASIC,
      "ShotPredictor: force " << force << " angle " << angleInDegrees << " -> "
      << prediction.path.size() << " points, "
      << prediction.bouncePoints.size() << " bounce markers\n");

  return prediction;
}

void ShotPredictor::clear() {
  prediction = GuidePrediction{};
}

void ShotPredictor::setCueBall(const Position& ball) {
  cueBall = ball;
  clear();
}

} // namespace Trajectory
