/**
 * @file mosaic_layout.hpp
 * @brief Frame layouts for full-disk and sun-side mosaics and scans.
 *
 * Every function here works in a single caller-chosen angular unit and a
 * single time unit; rates are angle per time unit. Nothing is converted.
 *
 * @date 2024-12-3
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_PLANNING_MOSAIC_LAYOUT_HPP
#define TESSERA_PLANNING_MOSAIC_LAYOUT_HPP

#include <vector>

#include "geometry/polygon.hpp"
#include "step_optimizer.hpp"
#include "tour_solver.hpp"

namespace tessera::planning {

// ============================================================================
// Layout Results
// ============================================================================

/**
 * @brief Rectangular grid of frames visited column by column.
 *
 * Columns run along x ("lines"), frames inside a column along y ("points").
 */
struct GridLayout {
    SteppingPlan columns;
    SteppingPlan rows;
    double lineSlewTime = 0.0;
    double pointSlewTime = 0.0;

    [[nodiscard]] geometry::Point start() const noexcept {
        return {columns.start, rows.start};
    }
    [[nodiscard]] geometry::Point delta() const noexcept {
        return {columns.step, rows.step};
    }
    [[nodiscard]] int frameCount() const noexcept {
        return columns.count * rows.count;
    }
};

/**
 * @brief Vertical scan lines tiled along x.
 */
struct ScanLayout {
    SteppingPlan lines;
    double startY = 0.0;
    double deltaY = 0.0;
    double lineSlewTime = 0.0;
};

// ============================================================================
// Layout Operations
// ============================================================================

/**
 * @brief Frame centers of a grid in serpentine order.
 *
 * The outer loop walks x from start.x in steps of delta.x. Inside each
 * column y runs forward on even column indices and backward on odd ones.
 *
 * @throws InvalidParameter if either point count is below one
 */
[[nodiscard]] std::vector<geometry::Point> serpentineOrder(
    const geometry::Point& start, const geometry::Point& delta, int pointsX,
    int pointsY);

/**
 * @brief Symmetric grid covering a disk of the given diameter.
 *
 * @param targetDiameter Apparent diameter of the target
 * @param fov Frame size
 * @param margin Extra coverage as a fraction of the diameter, > -1
 * @param minOverlap Fractional overlap of neighbours, in [0, 1)
 * @param slewRate Angle per time unit, > 0
 * @throws InvalidParameter on out-of-range input
 */
[[nodiscard]] GridLayout layoutSymmetricMosaic(double targetDiameter,
                                               const geometry::Size& fov,
                                               double margin, double minOverlap,
                                               double slewRate);

/**
 * @brief Grid restricted to the illuminated part of the target.
 *
 * Builds a grid whose x extent follows the shape's bounding width, drops
 * frames sharing no area with the shape and orders the rest along a short
 * open tour.
 *
 * @return Ordered frame centers, never empty
 * @throws InvalidParameter on out-of-range input or when no frame survives
 */
[[nodiscard]] std::vector<geometry::Point> layoutSunsideMosaic(
    double targetDiameter, const geometry::Size& fov, double margin,
    double minOverlap, const geometry::Polygon& illuminatedShape,
    int tourPasses = DEFAULT_TOUR_PASSES);

/**
 * @brief Scan lines spanning the full disk height, tiled over its width.
 */
[[nodiscard]] ScanLayout layoutSymmetricScan(double targetDiameter,
                                             double fovWidth, double margin,
                                             double minOverlap,
                                             double transferSlewRate);

/**
 * @brief Scan lines tiled over the illuminated shape's width.
 *
 * Lines keep the full disk height and are never filtered.
 */
[[nodiscard]] ScanLayout layoutSunsideScan(
    double targetDiameter, double fovWidth, double margin, double minOverlap,
    double transferSlewRate, const geometry::Polygon& illuminatedShape);

}  // namespace tessera::planning

#endif  // TESSERA_PLANNING_MOSAIC_LAYOUT_HPP
