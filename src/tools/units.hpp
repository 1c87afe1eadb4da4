/**
 * @file units.hpp
 * @brief Angular and time units carried through the planning engine.
 *
 * @date 2024-12-2
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_TOOLS_UNITS_HPP
#define TESSERA_TOOLS_UNITS_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace tessera::tools {

// ============================================================================
// Unit Enumerations
// ============================================================================

/**
 * @brief Angular unit of every angle handed to a generator or result.
 */
enum class AngularUnit : uint8_t { Degrees, Radians, ArcMinutes, ArcSeconds };

/**
 * @brief Time unit of every duration handed to a generator or result.
 */
enum class TimeUnit : uint8_t { Seconds, Minutes, Hours };

/// Canonical short name ("deg", "rad", "arcMin", "arcSec")
[[nodiscard]] std::string_view toString(AngularUnit unit) noexcept;

/// Canonical short name ("sec", "min", "hour")
[[nodiscard]] std::string_view toString(TimeUnit unit) noexcept;

/**
 * @brief Parse an angular unit name.
 * @throws InvalidParameter if the name is unknown
 */
[[nodiscard]] AngularUnit angularUnitFromString(std::string_view name);

/**
 * @brief Parse a time unit name.
 * @throws InvalidParameter if the name is unknown
 */
[[nodiscard]] TimeUnit timeUnitFromString(std::string_view name);

// ============================================================================
// Conversions
// ============================================================================

/// Size of one unit in degrees
[[nodiscard]] double degreesPer(AngularUnit unit) noexcept;

/// Size of one unit in seconds
[[nodiscard]] double secondsPer(TimeUnit unit) noexcept;

[[nodiscard]] double convertAngle(double value, AngularUnit from,
                                  AngularUnit to) noexcept;

[[nodiscard]] double convertTime(double value, TimeUnit from,
                                 TimeUnit to) noexcept;

/**
 * @brief Convert a scalar time in the given unit to a clock duration.
 *
 * The value is rounded to the nearest nanosecond.
 */
[[nodiscard]] std::chrono::nanoseconds toDuration(double value,
                                                  TimeUnit unit) noexcept;

}  // namespace tessera::tools

#endif  // TESSERA_TOOLS_UNITS_HPP
