/**
 * @file ptr_reader.hpp
 * @brief Parsing of pointing-request (PTR) observation blocks.
 *
 * @date 2024-12-5
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_PTR_PTR_READER_HPP
#define TESSERA_PTR_PTR_READER_HPP

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "geometry/polygon.hpp"
#include "tools/time.hpp"

namespace tessera::ptr {

/**
 * @brief Content of one PTR observation block.
 *
 * Scalar offset fields (xStart, lineDelta, dwellTime, ...) are stored by
 * element name. Positions are in the planning frame: the x negation of scan
 * xStart/lineDelta and of custom xAngles is undone.
 */
struct PtrBlock {
    std::string target;
    tools::TimePoint startTime;
    tools::TimePoint endTime;
    std::string offsetRef;
    tools::TimePoint offsetStartTime;
    std::map<std::string, double> values;
    std::map<std::string, std::string> units;
    std::vector<double> deltaTimes;
    std::vector<double> xAngles;
    std::vector<double> yAngles;

    /**
     * @brief Scalar offset field by element name.
     * @throws PtrParseError if the field is absent
     */
    [[nodiscard]] double value(const std::string& name) const;

    /// One center per point of a custom block
    [[nodiscard]] std::vector<geometry::Point> customPoints() const;
};

/**
 * @brief Parse a single PTR block.
 * @throws PtrParseError if the text is not a well-formed block
 */
[[nodiscard]] PtrBlock parseBlock(std::string_view text);

}  // namespace tessera::ptr

#endif  // TESSERA_PTR_PTR_READER_HPP
