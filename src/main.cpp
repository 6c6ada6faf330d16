/**
 * @file main.cpp
 * @brief Command line entry point: prints the predicted path of one shot.
 *
 * Usage: poolshot_predict x y angleDeg force tableWidth tableHeight [maxBounces]
 *
 * Prints one "x y" line per path point, marking true rail contacts with
 * "contact" and heuristic bounce markers with "marker".
 */

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include "poolshot/core/constants.hpp"
#include "poolshot/core/profile.hpp"
#include "poolshot/core/trajectory_simulator.hpp"
#include "poolshot/trajectory/post_processing.hpp"

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " x y angleDeg force tableWidth tableHeight [maxBounces]\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 7 && argc != 8) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    Trajectory::LaunchRequest request;
    try {
        request.origin = Position(std::stod(argv[1]), std::stod(argv[2]));
        request.angleInDegrees = std::stod(argv[3]);
        request.force = std::stod(argv[4]);
        request.tableWidth = std::stod(argv[5]);
        request.tableHeight = std::stod(argv[6]);
        request.maxBounces = argc == 8 ? std::stoi(argv[7])
                                       : SimulatorConstants::DefaultMaxBounces;
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    Trajectory::SimulationResult result;
    {
        PROFILE_SCOPE("main");
        Trajectory::TrajectorySimulator const simulator;
        result = simulator.simulateDetailed(request);
    }

    std::set<std::size_t> const contacts(result.contactIndices.begin(), result.contactIndices.end());
    Trajectory::Path const markers = Trajectory::extractBouncePoints(result.path);
    std::set<std::pair<double, double>> markerSet;
    for (const auto& m : markers) {
        markerSet.emplace(m.x, m.y);
    }

    std::cout << std::fixed << std::setprecision(3);
    for (std::size_t i = 0; i < result.path.size(); ++i) {
        const Position& p = result.path[i];
        std::cout << p.x << " " << p.y;
        if (contacts.count(i) > 0) {
            std::cout << " contact";
        }
        if (markerSet.count({p.x, p.y}) > 0) {
            std::cout << " marker";
        }
        std::cout << "\n";
    }

    std::cout << "# points: " << result.path.size()
              << ", bounces: " << result.bounces
              << ", stopped by: " << Trajectory::toString(result.termination) << "\n";

    Profiling::Profiler::printStats();
    return EXIT_SUCCESS;
}
