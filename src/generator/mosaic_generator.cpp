#include "mosaic_generator.hpp"

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "planning/mosaic_layout.hpp"

namespace tessera::generator {

MosaicGenerator::MosaicGenerator(
    std::shared_ptr<const ephemeris::CelestialGeometry> geometry,
    model::ObservationContext context, MosaicSettings settings)
    : geometry_(std::move(geometry)),
      context_(std::move(context)),
      settings_(std::move(settings)) {
    if (!geometry_) {
        THROW_INVALID_PARAMETER("Mosaic generator needs a geometry source");
    }
    if (!(settings_.fovSize.width > 0.0) || !(settings_.fovSize.height > 0.0)) {
        THROW_INVALID_PARAMETER("FOV size must be positive, got ",
                                settings_.fovSize.width, " x ",
                                settings_.fovSize.height);
    }
    if (!(settings_.dwellTime >= 0.0)) {
        THROW_INVALID_PARAMETER("Dwell time must be non-negative, got ",
                                settings_.dwellTime);
    }
    if (!(settings_.slewRate > 0.0)) {
        THROW_INVALID_PARAMETER("Slew rate must be positive, got ",
                                settings_.slewRate);
    }
}

double MosaicGenerator::targetAngularDiameter() const {
    const double diameterRad = geometry_->angularDiameter(
        settings_.observer, context_.target, context_.startTime);
    return tools::convertAngle(diameterRad, tools::AngularUnit::Radians,
                               context_.angularUnit);
}

model::RasterMosaic MosaicGenerator::generateSymmetricMosaic(
    double margin, double minOverlap) const {
    const double diameter = targetAngularDiameter();
    const auto layout = planning::layoutSymmetricMosaic(
        diameter, settings_.fovSize, margin, minOverlap, settings_.slewRate);

    model::RasterGrid grid;
    grid.fovSize = settings_.fovSize;
    grid.start = layout.start();
    grid.delta = layout.delta();
    grid.pointsX = layout.columns.count;
    grid.pointsY = layout.rows.count;
    grid.dwellTime = settings_.dwellTime;
    grid.pointSlewTime = layout.pointSlewTime;
    grid.lineSlewTime = layout.lineSlewTime;

    SPDLOG_DEBUG("Symmetric mosaic of {}: {}x{} frames, diameter {:.4f} {}",
                 context_.target, grid.pointsX, grid.pointsY, diameter,
                 tools::toString(context_.angularUnit));
    return model::RasterMosaic(context_, grid);
}

model::CustomMosaic MosaicGenerator::generateSunsideMosaic(
    double margin, double minOverlap, int tourPasses) const {
    const double diameter = targetAngularDiameter();
    const auto shape = geometry_->illuminatedShape(
        settings_.observer, context_.target, context_.startTime,
        context_.angularUnit);
    auto points = planning::layoutSunsideMosaic(
        diameter, settings_.fovSize, margin, minOverlap, shape, tourPasses);

    SPDLOG_DEBUG("Sunside mosaic of {}: {} frames, diameter {:.4f} {}",
                 context_.target, points.size(), diameter,
                 tools::toString(context_.angularUnit));
    return model::CustomMosaic(context_, settings_.fovSize, settings_.dwellTime,
                               settings_.slewRate, std::move(points));
}

}  // namespace tessera::generator
