/**
 * @file constants.hpp
 * @brief Contains fundamental math constants.
 *
 * Compile-time constants shared by the geometry helpers and the simulator.
 */

#pragma once

namespace MathConstants {

constexpr double PI = 3.14159265358979323846;

constexpr double DEG_PER_RAD = 180.0 / PI;
constexpr double RAD_PER_DEG = PI / 180.0;

} // namespace MathConstants
