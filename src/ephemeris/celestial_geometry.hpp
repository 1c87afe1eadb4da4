/**
 * @file celestial_geometry.hpp
 * @brief Observer/target geometry queries used by the generators.
 *
 * @date 2024-12-5
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_EPHEMERIS_CELESTIAL_GEOMETRY_HPP
#define TESSERA_EPHEMERIS_CELESTIAL_GEOMETRY_HPP

#include <string>

#include "geometry/polygon.hpp"
#include "tools/time.hpp"
#include "tools/units.hpp"

namespace tessera::ephemeris {

/**
 * @brief Source of apparent target geometry as seen from an observer.
 *
 * Every query throws GeometryUnavailable when the geometry cannot be
 * resolved for the given observer, target and time.
 */
class CelestialGeometry {
public:
    virtual ~CelestialGeometry() = default;

    /**
     * @brief Apparent angular diameter of the target.
     * @return Diameter in radians
     */
    [[nodiscard]] virtual double angularDiameter(
        const std::string& observer, const std::string& target,
        const tools::TimePoint& time) const = 0;

    /**
     * @brief Sunlit silhouette of the target, +x toward the Sun.
     * @param unit Angular unit of the returned vertices
     */
    [[nodiscard]] virtual geometry::Polygon illuminatedShape(
        const std::string& observer, const std::string& target,
        const tools::TimePoint& time, tools::AngularUnit unit) const = 0;

    /**
     * @brief Velocity of the sub-observer point over the surface.
     * @return Velocity in km/s
     */
    [[nodiscard]] virtual double nadirSurfaceVelocity(
        const std::string& observer, const std::string& target,
        const tools::TimePoint& time) const = 0;

    /**
     * @brief Surface size of one detector pixel at the sub-observer point.
     * @param fovAngle Field of view along one axis, in degrees
     * @param fovPixels Number of pixels along that axis
     * @return Footprint in km
     */
    [[nodiscard]] virtual double pixelFootprint(
        const std::string& observer, const std::string& target,
        const tools::TimePoint& time, double fovAngle, int fovPixels) const = 0;
};

}  // namespace tessera::ephemeris

#endif  // TESSERA_EPHEMERIS_CELESTIAL_GEOMETRY_HPP
