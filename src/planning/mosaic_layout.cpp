#include "mosaic_layout.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "geometry/rectangle.hpp"

namespace tessera::planning {

namespace {

void validateCoverage(double targetDiameter, double margin, double minOverlap) {
    if (!(targetDiameter >= 0.0) || !std::isfinite(targetDiameter)) {
        THROW_INVALID_PARAMETER("Target diameter must be non-negative, got ",
                                targetDiameter);
    }
    if (!(margin > -1.0)) {
        THROW_INVALID_PARAMETER("Margin must be larger than -1.0, got ", margin);
    }
    if (!(minOverlap >= 0.0 && minOverlap < 1.0)) {
        THROW_INVALID_PARAMETER("Overlap must be in [0, 1), got ", minOverlap);
    }
}

void validateRate(double rate, const char* name) {
    if (!(rate > 0.0) || !std::isfinite(rate)) {
        THROW_INVALID_PARAMETER(name, " must be positive, got ", rate);
    }
}

// Every scan line sweeps the full disk height
void validateScanHeight(double diameterToCover) {
    if (!(diameterToCover > 0.0)) {
        THROW_INVALID_PARAMETER("Scan needs a positive height to sweep, got ",
                                diameterToCover);
    }
}

ScanLayout makeScanLayout(const SteppingPlan& lines, double diameterToCover,
                          double transferSlewRate) {
    ScanLayout layout;
    layout.lines = lines;
    layout.startY = diameterToCover / 2.0;
    layout.deltaY = -diameterToCover;
    layout.lineSlewTime = std::abs(lines.step) / transferSlewRate;
    return layout;
}

}  // namespace

std::vector<geometry::Point> serpentineOrder(const geometry::Point& start,
                                             const geometry::Point& delta,
                                             int pointsX, int pointsY) {
    if (pointsX < 1 || pointsY < 1) {
        THROW_INVALID_PARAMETER("Grid needs at least one point per axis, got ",
                                pointsX, " x ", pointsY);
    }
    std::vector<geometry::Point> points;
    points.reserve(static_cast<size_t>(pointsX) * static_cast<size_t>(pointsY));
    for (int ix = 0; ix < pointsX; ++ix) {
        const double x = start.x + ix * delta.x;
        for (int k = 0; k < pointsY; ++k) {
            const int iy = (ix % 2 == 0) ? k : pointsY - 1 - k;
            points.push_back({x, start.y + iy * delta.y});
        }
    }
    return points;
}

GridLayout layoutSymmetricMosaic(double targetDiameter, const geometry::Size& fov,
                                 double margin, double minOverlap,
                                 double slewRate) {
    validateCoverage(targetDiameter, margin, minOverlap);
    validateRate(slewRate, "Slew rate");

    const double diameterToCover = targetDiameter * (1.0 + margin);
    GridLayout layout;
    layout.columns = optimizeStepsCentered(diameterToCover, fov.width, minOverlap);
    layout.rows = optimizeStepsCentered(diameterToCover, fov.height, minOverlap);
    layout.lineSlewTime = std::abs(layout.columns.step) / slewRate;
    layout.pointSlewTime = std::abs(layout.rows.step) / slewRate;

    SPDLOG_DEBUG("Symmetric mosaic: {}x{} frames covering {:.6f}",
                 layout.columns.count, layout.rows.count, diameterToCover);
    return layout;
}

std::vector<geometry::Point> layoutSunsideMosaic(
    double targetDiameter, const geometry::Size& fov, double margin,
    double minOverlap, const geometry::Polygon& illuminatedShape,
    int tourPasses) {
    validateCoverage(targetDiameter, margin, minOverlap);

    const double diameterToCover = targetDiameter * (1.0 + margin);
    const auto shapeBounds = illuminatedShape.bounds();
    const double shapeWidth = shapeBounds.width() * (1.0 + margin);

    const auto columns =
        optimizeStepsCentered(shapeWidth, fov.width, minOverlap)
            .shifted(shapeBounds.centerX());
    const auto rows = optimizeStepsCentered(diameterToCover, fov.height, minOverlap);

    const auto grid = serpentineOrder({columns.start, rows.start},
                                      {columns.step, rows.step}, columns.count,
                                      rows.count);

    std::vector<geometry::Point> kept;
    kept.reserve(grid.size());
    for (const auto& center : grid) {
        const geometry::Rectangle frame(center, fov);
        if (frame.toPolygon().overlaps(illuminatedShape)) {
            kept.push_back(center);
        }
    }
    if (kept.empty()) {
        THROW_INVALID_PARAMETER("No mosaic frame overlaps the illuminated shape");
    }

    const auto order = solveTour(buildDistanceMatrix(kept), tourPasses);
    std::vector<geometry::Point> ordered;
    ordered.reserve(order.size());
    for (size_t index : order) {
        ordered.push_back(kept[index]);
    }

    SPDLOG_DEBUG("Sunside mosaic: kept {} of {} frames", ordered.size(),
                 grid.size());
    return ordered;
}

ScanLayout layoutSymmetricScan(double targetDiameter, double fovWidth,
                               double margin, double minOverlap,
                               double transferSlewRate) {
    validateCoverage(targetDiameter, margin, minOverlap);
    validateRate(transferSlewRate, "Transfer slew rate");

    const double diameterToCover = targetDiameter * (1.0 + margin);
    validateScanHeight(diameterToCover);
    const auto lines = optimizeStepsCentered(diameterToCover, fovWidth, minOverlap);

    SPDLOG_DEBUG("Symmetric scan: {} lines covering {:.6f}", lines.count,
                 diameterToCover);
    return makeScanLayout(lines, diameterToCover, transferSlewRate);
}

ScanLayout layoutSunsideScan(double targetDiameter, double fovWidth,
                             double margin, double minOverlap,
                             double transferSlewRate,
                             const geometry::Polygon& illuminatedShape) {
    validateCoverage(targetDiameter, margin, minOverlap);
    validateRate(transferSlewRate, "Transfer slew rate");

    const double diameterToCover = targetDiameter * (1.0 + margin);
    validateScanHeight(diameterToCover);
    const auto shapeBounds = illuminatedShape.bounds();
    const double shapeWidth = shapeBounds.width() * (1.0 + margin);
    const auto lines = optimizeStepsCentered(shapeWidth, fovWidth, minOverlap)
                           .shifted(shapeBounds.centerX());

    SPDLOG_DEBUG("Sunside scan: {} lines over shape width {:.6f}", lines.count,
                 shapeWidth);
    return makeScanLayout(lines, diameterToCover, transferSlewRate);
}

}  // namespace tessera::planning
