/**
 * @fileoverview shot_predictor.hpp
 * @brief Keeps the guide line of one aiming session up to date.
 */

#pragma once

#include <optional>

#include "poolshot/core/launch_request.hpp"
#include "poolshot/core/trajectory_simulator.hpp"

namespace Trajectory {

/**
 * @brief What the renderer needs to draw the guide line
 */
struct GuidePrediction {
  Path path;
  Path bouncePoints;                 ///< heuristic markers from extractBouncePoints
  std::optional<Position> endPoint;  ///< last path point
  int contactCount = 0;              ///< true rail contacts reported by the simulator
  StopReason termination = StopReason::InvalidInput;
};

/**
 * @class ShotPredictor
 * @brief Recomputes the prediction on every aim update, last write wins.
 *
 * Each update fully replaces the previous prediction. Forces at or below
 * SimulatorConstants::MinimumGuideForce clear it instead.
 */
class ShotPredictor {
 public:
  /**
   * @param simulator Simulator to run; must outlive the predictor
   * @param cueBall Launch position on the playing surface
   * @param tableWidth Playing surface width
   * @param tableHeight Playing surface height
   */
  ShotPredictor(const TrajectorySimulator& simulator, const Position& cueBall,
                double tableWidth, double tableHeight);

  /**
   * @brief Handles one aim update from the cue gesture.
   * @param force Pull strength as a 0-100 percentage
   * @param angleInDegrees Shot bearing
   * @return The prediction now current
   */
  const GuidePrediction& update(double force, double angleInDegrees);

  /**
   * @brief Drops the prediction, e.g. when the gesture ends.
   */
  void clear();

  /**
   * @brief Moves the cue ball; the current prediction is dropped.
   */
  void setCueBall(const Position& cueBall);

  const GuidePrediction& current() const { return prediction; }
  bool hasPrediction() const { return !prediction.path.empty(); }

 private:
  const TrajectorySimulator& simulator;
  Position cueBall;
  double tableWidth;
  double tableHeight;
  GuidePrediction prediction;
};

} // namespace Trajectory
