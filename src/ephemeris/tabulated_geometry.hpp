/**
 * @file tabulated_geometry.hpp
 * @brief Celestial geometry interpolated from a precomputed JSON table.
 *
 * @date 2024-12-5
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_EPHEMERIS_TABULATED_GEOMETRY_HPP
#define TESSERA_EPHEMERIS_TABULATED_GEOMETRY_HPP

#include <filesystem>
#include <map>
#include <vector>

#include <nlohmann/json.hpp>

#include "celestial_geometry.hpp"

namespace tessera::ephemeris {

using json = nlohmann::json;

/**
 * @brief One row of the geometry table.
 */
struct GeometrySample {
    tools::TimePoint time;
    double angularDiameter = 0.0;  ///< rad
    double nadirVelocity = 0.0;    ///< km/s
    double distance = 0.0;         ///< km, observer to sub-observer point
    double phaseAngle = 0.0;       ///< deg, Sun-target-observer
};

/**
 * @brief Geometry provider backed by per-target time series.
 *
 * The table looks like
 * ```json
 * {
 *   "observer": "JUICE",
 *   "targets": {
 *     "CALLISTO": {
 *       "samples": [
 *         {"time": "2031-04-26T00:00:00", "angularDiameter": 0.19,
 *          "nadirVelocity": 4.1, "distance": 25000.0, "phaseAngle": 35.0}
 *       ]
 *     }
 *   }
 * }
 * ```
 * Values between samples are interpolated linearly. Queries outside the
 * tabulated time span, for another observer or for an unknown target throw
 * GeometryUnavailable.
 */
class TabulatedGeometry : public CelestialGeometry {
public:
    /// Vertices per half of the illuminated outline
    static constexpr int DEFAULT_OUTLINE_RESOLUTION = 32;

    /**
     * @throws InvalidConfiguration if the table is malformed
     */
    explicit TabulatedGeometry(const json& table,
                               int outlineResolution = DEFAULT_OUTLINE_RESOLUTION);

    /**
     * @brief Load a table from a JSON file.
     * @throws InvalidConfiguration if the file cannot be read or parsed
     */
    [[nodiscard]] static TabulatedGeometry fromFile(
        const std::filesystem::path& path);

    [[nodiscard]] const std::string& observer() const noexcept {
        return observer_;
    }

    /// Interpolated sample for a target at a time
    [[nodiscard]] GeometrySample sample(const std::string& observer,
                                        const std::string& target,
                                        const tools::TimePoint& time) const;

    [[nodiscard]] double angularDiameter(
        const std::string& observer, const std::string& target,
        const tools::TimePoint& time) const override;

    [[nodiscard]] geometry::Polygon illuminatedShape(
        const std::string& observer, const std::string& target,
        const tools::TimePoint& time, tools::AngularUnit unit) const override;

    [[nodiscard]] double nadirSurfaceVelocity(
        const std::string& observer, const std::string& target,
        const tools::TimePoint& time) const override;

    [[nodiscard]] double pixelFootprint(const std::string& observer,
                                        const std::string& target,
                                        const tools::TimePoint& time,
                                        double fovAngle,
                                        int fovPixels) const override;

private:
    std::string observer_;
    std::map<std::string, std::vector<GeometrySample>> samples_;
    int outlineResolution_;
};

/**
 * @brief Outline of the lit part of a disk.
 *
 * The limb half toward +x is followed by the terminator, an ellipse with
 * semi-axes radius and radius * cos(phase).
 *
 * @param radius Apparent radius
 * @param phaseAngle Sun-target-observer angle in degrees, in [0, 180)
 * @param resolution Vertices per half of the outline, at least 2
 * @throws GeometryUnavailable if the target shows no lit area
 */
[[nodiscard]] geometry::Polygon litDiskOutline(double radius, double phaseAngle,
                                               int resolution);

}  // namespace tessera::ephemeris

#endif  // TESSERA_EPHEMERIS_TABULATED_GEOMETRY_HPP
