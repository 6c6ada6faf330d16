/**
 * @fileoverview launch_request.cpp
 * @brief Names for simulation stop reasons.
 */

#include "poolshot/core/launch_request.hpp"

namespace Trajectory {

const char* toString(StopReason reason) {
  switch (reason) {
    case StopReason::InvalidInput:          return "INVALID_INPUT";
    case StopReason::BounceBudgetExhausted: return "BOUNCE_BUDGET_EXHAUSTED";
    case StopReason::PointCapReached:       return "POINT_CAP_REACHED";
    case StopReason::VelocityDecayed:       return "VELOCITY_DECAYED";
  }
  return "UNKNOWN";
}

}  // namespace Trajectory
