/**
 * @file mosaic_generator.hpp
 * @brief Builds mosaics for a target from live celestial geometry.
 *
 * @date 2024-12-6
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_GENERATOR_MOSAIC_GENERATOR_HPP
#define TESSERA_GENERATOR_MOSAIC_GENERATOR_HPP

#include <memory>
#include <string>

#include "ephemeris/celestial_geometry.hpp"
#include "model/custom_mosaic.hpp"
#include "model/raster_mosaic.hpp"
#include "planning/tour_solver.hpp"

namespace tessera::generator {

/**
 * @brief Framing-camera settings for one mosaic request.
 *
 * FOV, dwell time and slew rate are in the context's units; the slew rate
 * is angle per time unit.
 */
struct MosaicSettings {
    std::string observer;
    geometry::Size fovSize;
    double dwellTime = 0.0;
    double slewRate = 0.0;
};

/**
 * @brief Generator of full-disk and sun-side mosaics.
 *
 * The target's angular diameter and illuminated shape are queried once, at
 * the context's start time, for every generated mosaic.
 */
class MosaicGenerator {
public:
    /**
     * @throws InvalidParameter if geometry is null or a setting is out of range
     */
    MosaicGenerator(std::shared_ptr<const ephemeris::CelestialGeometry> geometry,
                    model::ObservationContext context, MosaicSettings settings);

    [[nodiscard]] const model::ObservationContext& context() const noexcept {
        return context_;
    }
    [[nodiscard]] const MosaicSettings& settings() const noexcept {
        return settings_;
    }

    /// Apparent diameter at the start time, in the context's angular unit
    [[nodiscard]] double targetAngularDiameter() const;

    /**
     * @brief Regular grid covering the whole disk plus margin.
     * @param margin Extra coverage as a fraction of the diameter, > -1
     * @param minOverlap Fractional overlap between neighbours, in [0, 1)
     */
    [[nodiscard]] model::RasterMosaic generateSymmetricMosaic(
        double margin, double minOverlap) const;

    /**
     * @brief Frames covering only the sunlit part of the disk.
     *
     * @param tourPasses Improvement rounds for the visiting order
     * @throws InvalidParameter if no frame touches the lit area
     * @throws GeometryUnavailable if the shape cannot be computed
     */
    [[nodiscard]] model::CustomMosaic generateSunsideMosaic(
        double margin, double minOverlap,
        int tourPasses = planning::DEFAULT_TOUR_PASSES) const;

private:
    std::shared_ptr<const ephemeris::CelestialGeometry> geometry_;
    model::ObservationContext context_;
    MosaicSettings settings_;
};

}  // namespace tessera::generator

#endif  // TESSERA_GENERATOR_MOSAIC_GENERATOR_HPP
