#include "poolshot/core/constants.hpp"

namespace SimulatorConstants {

    const int DefaultMaxBounces = 10;

    const double DefaultBounceAngleThreshold = 30.0;
    const double DefaultSmoothingSpacing     = 10.0;

    const double MinimumGuideForce  = 5.0;
    const int    GuideLineMaxBounces = 8;

} // namespace SimulatorConstants
