/**
 * @file time.hpp
 * @brief UTC timestamp helpers for observation windows.
 *
 * @date 2024-12-2
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_TOOLS_TIME_HPP
#define TESSERA_TOOLS_TIME_HPP

#include <chrono>
#include <string>
#include <string_view>

namespace tessera::tools {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::nanoseconds>;

/**
 * @brief Format a time point as "YYYY-MM-DDTHH:MM:SS" in UTC.
 *
 * Sub-second parts are truncated.
 */
[[nodiscard]] std::string formatIsoTime(const TimePoint& time);

/**
 * @brief Parse "YYYY-MM-DDTHH:MM:SS[.fff][Z]" as a UTC time point.
 *
 * A space is accepted in place of the 'T' separator.
 *
 * @throws InvalidParameter if the text is malformed
 */
[[nodiscard]] TimePoint parseIsoTime(std::string_view text);

/// Drop the sub-second part of a time point
[[nodiscard]] TimePoint truncateToSeconds(const TimePoint& time) noexcept;

}  // namespace tessera::tools

#endif  // TESSERA_TOOLS_TIME_HPP
