/**
 * @file constants.hpp
 * @brief Conversion constants shared by the planning engine.
 *
 * @date 2024-12-2
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_TOOLS_CONSTANTS_HPP
#define TESSERA_TOOLS_CONSTANTS_HPP

#include <numbers>

namespace tessera::tools {

// ============================================================================
// Mathematical Constants
// ============================================================================

inline constexpr double K_PI = std::numbers::pi;

// ============================================================================
// Angular Conversion Constants
// ============================================================================

/// Conversion factor: degrees to radians
inline constexpr double DEG_TO_RAD = K_PI / 180.0;
/// Conversion factor: radians to degrees
inline constexpr double RAD_TO_DEG = 180.0 / K_PI;
/// Arcminutes per degree
inline constexpr double ARCMIN_PER_DEG = 60.0;
/// Arcseconds per degree
inline constexpr double ARCSEC_PER_DEG = 3600.0;

// ============================================================================
// Time Constants
// ============================================================================

inline constexpr double SECONDS_PER_MINUTE = 60.0;
inline constexpr double SECONDS_PER_HOUR = 3600.0;

// ============================================================================
// Planning Tolerances
// ============================================================================

/// Bias subtracted before rounding up a step count
inline constexpr double STEP_COUNT_EPSILON = 1e-5;
/// Minimum gain for a tour improvement to be applied
inline constexpr double TOUR_GAIN_EPSILON = 1e-12;

}  // namespace tessera::tools

#endif  // TESSERA_TOOLS_CONSTANTS_HPP
