#ifndef POOLSHOT_SIMULATOR_CONSTANTS_HPP
#define POOLSHOT_SIMULATOR_CONSTANTS_HPP

namespace SimulatorConstants {

    // Request defaults
    extern const int DefaultMaxBounces;

    // Post-processing defaults
    extern const double DefaultBounceAngleThreshold;  // degrees
    extern const double DefaultSmoothingSpacing;      // table units

    // Aiming session
    extern const double MinimumGuideForce;   // guide line hidden at or below this force
    extern const int GuideLineMaxBounces;

} // namespace SimulatorConstants

#endif // POOLSHOT_SIMULATOR_CONSTANTS_HPP
