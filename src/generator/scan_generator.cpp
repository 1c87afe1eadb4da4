#include "scan_generator.hpp"

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "planning/mosaic_layout.hpp"

namespace tessera::generator {

namespace {

model::ScanGeometry toScanGeometry(const planning::ScanLayout& layout,
                                   double fovWidth, double scanSlewRate,
                                   double borderSlewTime) {
    model::ScanGeometry lines;
    lines.fovWidth = fovWidth;
    lines.scanSlewRate = scanSlewRate;
    lines.lineSlewTime = layout.lineSlewTime;
    lines.borderSlewTime = borderSlewTime;
    lines.start = {layout.lines.start, layout.startY};
    lines.delta = {layout.lines.step, layout.deltaY};
    lines.numberOfLines = layout.lines.count;
    return lines;
}

}  // namespace

ScanGenerator::ScanGenerator(
    std::shared_ptr<const ephemeris::CelestialGeometry> geometry,
    model::ObservationContext context, ScanSettings settings)
    : geometry_(std::move(geometry)),
      context_(std::move(context)),
      settings_(std::move(settings)) {
    if (!geometry_) {
        THROW_INVALID_PARAMETER("Scan generator needs a geometry source");
    }
    if (!(settings_.fovWidth > 0.0)) {
        THROW_INVALID_PARAMETER("FOV width must be positive, got ",
                                settings_.fovWidth);
    }
    if (!(settings_.scanSlewRate > 0.0)) {
        THROW_INVALID_PARAMETER("Scan slew rate must be positive, got ",
                                settings_.scanSlewRate);
    }
    if (!(settings_.transferSlewRate > 0.0)) {
        THROW_INVALID_PARAMETER("Transfer slew rate must be positive, got ",
                                settings_.transferSlewRate);
    }
    if (settings_.borderSlewTime && !(*settings_.borderSlewTime > 0.0)) {
        THROW_INVALID_PARAMETER("Border slew time must be positive, got ",
                                *settings_.borderSlewTime);
    }
}

double ScanGenerator::targetAngularDiameter() const {
    const double diameterRad = geometry_->angularDiameter(
        settings_.observer, context_.target, context_.startTime);
    return tools::convertAngle(diameterRad, tools::AngularUnit::Radians,
                               context_.angularUnit);
}

double ScanGenerator::borderSlewTime() const {
    return settings_.borderSlewTime.value_or(
        tools::convertTime(DEFAULT_BORDER_SLEW_MINUTES, tools::TimeUnit::Minutes,
                           context_.timeUnit));
}

model::Scan ScanGenerator::generateSymmetricScan(double margin,
                                                 double minOverlap) const {
    const double diameter = targetAngularDiameter();
    const auto layout = planning::layoutSymmetricScan(
        diameter, settings_.fovWidth, margin, minOverlap,
        settings_.transferSlewRate);

    SPDLOG_DEBUG("Symmetric scan of {}: {} lines, diameter {:.4f} {}",
                 context_.target, layout.lines.count, diameter,
                 tools::toString(context_.angularUnit));
    return model::Scan(context_,
                       toScanGeometry(layout, settings_.fovWidth,
                                      settings_.scanSlewRate, borderSlewTime()));
}

model::Scan ScanGenerator::generateSunsideScan(double margin,
                                               double minOverlap) const {
    const double diameter = targetAngularDiameter();
    const auto shape = geometry_->illuminatedShape(
        settings_.observer, context_.target, context_.startTime,
        context_.angularUnit);
    const auto layout = planning::layoutSunsideScan(
        diameter, settings_.fovWidth, margin, minOverlap,
        settings_.transferSlewRate, shape);

    SPDLOG_DEBUG("Sunside scan of {}: {} lines, diameter {:.4f} {}",
                 context_.target, layout.lines.count, diameter,
                 tools::toString(context_.angularUnit));
    return model::Scan(context_,
                       toScanGeometry(layout, settings_.fovWidth,
                                      settings_.scanSlewRate, borderSlewTime()));
}

}  // namespace tessera::generator
