/**
 * @file scan_generator.hpp
 * @brief Builds slit scans for a target from live celestial geometry.
 *
 * @date 2024-12-6
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_GENERATOR_SCAN_GENERATOR_HPP
#define TESSERA_GENERATOR_SCAN_GENERATOR_HPP

#include <memory>
#include <optional>
#include <string>

#include "ephemeris/celestial_geometry.hpp"
#include "model/scan.hpp"

namespace tessera::generator {

/// Border slew used when none is configured, in minutes
inline constexpr double DEFAULT_BORDER_SLEW_MINUTES = 5.0;

/**
 * @brief Slit-instrument settings for one scan request.
 *
 * scanSlewRate is the measurement rate along a line and transferSlewRate
 * the rate between lines, both angle per time unit.
 */
struct ScanSettings {
    std::string observer;
    double fovWidth = 0.0;
    double scanSlewRate = 0.0;
    double transferSlewRate = 0.0;
    /// Defaults to five minutes in the context's time unit
    std::optional<double> borderSlewTime;
};

/**
 * @brief Generator of full-disk and sun-side scans.
 */
class ScanGenerator {
public:
    /**
     * @throws InvalidParameter if geometry is null or a setting is out of range
     */
    ScanGenerator(std::shared_ptr<const ephemeris::CelestialGeometry> geometry,
                  model::ObservationContext context, ScanSettings settings);

    [[nodiscard]] const model::ObservationContext& context() const noexcept {
        return context_;
    }

    /// Apparent diameter at the start time, in the context's angular unit
    [[nodiscard]] double targetAngularDiameter() const;

    /**
     * @brief Lines spanning the disk height, tiled over the disk width.
     */
    [[nodiscard]] model::Scan generateSymmetricScan(double margin,
                                                    double minOverlap) const;

    /**
     * @brief Lines spanning the disk height, tiled over the lit width.
     *
     * Lines outside the lit area are kept.
     */
    [[nodiscard]] model::Scan generateSunsideScan(double margin,
                                                  double minOverlap) const;

private:
    [[nodiscard]] double borderSlewTime() const;

    std::shared_ptr<const ephemeris::CelestialGeometry> geometry_;
    model::ObservationContext context_;
    ScanSettings settings_;
};

}  // namespace tessera::generator

#endif  // TESSERA_GENERATOR_SCAN_GENERATOR_HPP
