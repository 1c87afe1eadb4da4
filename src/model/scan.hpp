/**
 * @file scan.hpp
 * @brief Slit-instrument scan made of vertical lines.
 *
 * @date 2024-12-4
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_MODEL_SCAN_HPP
#define TESSERA_MODEL_SCAN_HPP

#include "observation.hpp"

namespace tessera::model {

/**
 * @brief Line geometry and timing of a scan.
 *
 * delta.x is the spacing between lines, delta.y the signed length of each
 * line. Rates are angle per time unit.
 */
struct ScanGeometry {
    double fovWidth = 0.0;
    double scanSlewRate = 0.0;
    double lineSlewTime = 0.0;
    double borderSlewTime = 0.0;
    geometry::Point start;
    geometry::Point delta;
    int numberOfLines = 1;
};

/**
 * @brief Scan sweeping each line in one continuous slew.
 *
 * The block starts ten seconds before the first border slew and ends one
 * minute after the last one.
 */
class Scan : public Observation {
public:
    /**
     * @throws InvalidParameter if a width, rate or time is not positive or
     * there are no lines
     */
    Scan(ObservationContext context, ScanGeometry lines);

    [[nodiscard]] const ScanGeometry& scanGeometry() const noexcept {
        return geometry_;
    }
    [[nodiscard]] int numberOfLines() const noexcept {
        return geometry_.numberOfLines;
    }

    [[nodiscard]] double duration() const override;
    [[nodiscard]] tools::TimePoint endTime() const override;
    [[nodiscard]] std::vector<geometry::Point> centerPoints() const override;
    [[nodiscard]] std::vector<geometry::Rectangle> rectangles() const override;
    [[nodiscard]] json toJson() const override;

private:
    ScanGeometry geometry_;
};

}  // namespace tessera::model

#endif  // TESSERA_MODEL_SCAN_HPP
