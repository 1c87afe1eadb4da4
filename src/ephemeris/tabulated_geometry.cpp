#include "tabulated_geometry.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "tools/constants.hpp"

namespace tessera::ephemeris {

namespace {

// Phase angles beyond this leave no measurable lit area
constexpr double MAX_PHASE_ANGLE_DEG = 179.9;

GeometrySample parseSample(const json& j) {
    GeometrySample sample;
    sample.time = tools::parseIsoTime(j.at("time").get<std::string>());
    sample.angularDiameter = j.at("angularDiameter").get<double>();
    sample.nadirVelocity = j.value("nadirVelocity", 0.0);
    sample.distance = j.value("distance", 0.0);
    sample.phaseAngle = j.value("phaseAngle", 0.0);
    if (!(sample.angularDiameter > 0.0)) {
        THROW_INVALID_CONFIGURATION("Angular diameter must be positive at ",
                                    j.at("time").get<std::string>());
    }
    return sample;
}

double lerp(double a, double b, double t) noexcept { return a + (b - a) * t; }

}  // namespace

TabulatedGeometry::TabulatedGeometry(const json& table, int outlineResolution)
    : outlineResolution_(outlineResolution) {
    if (outlineResolution_ < 2) {
        THROW_INVALID_CONFIGURATION("Outline resolution must be at least 2");
    }
    try {
        observer_ = table.at("observer").get<std::string>();
        for (const auto& [name, target] : table.at("targets").items()) {
            std::vector<GeometrySample> rows;
            for (const auto& item : target.at("samples")) {
                rows.push_back(parseSample(item));
            }
            if (rows.empty()) {
                THROW_INVALID_CONFIGURATION("Target ", name, " has no samples");
            }
            for (size_t i = 1; i < rows.size(); ++i) {
                if (rows[i].time <= rows[i - 1].time) {
                    THROW_INVALID_CONFIGURATION(
                        "Samples of ", name, " are not in increasing time order");
                }
            }
            samples_[name] = std::move(rows);
        }
    } catch (const json::exception& e) {
        THROW_INVALID_CONFIGURATION("Malformed geometry table: ", e.what());
    } catch (const InvalidParameter& e) {
        THROW_INVALID_CONFIGURATION("Malformed geometry table: ", e.what());
    }
    spdlog::info("Loaded geometry table for observer {} with {} targets",
                 observer_, samples_.size());
}

TabulatedGeometry TabulatedGeometry::fromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_INVALID_CONFIGURATION("Cannot open geometry table: ",
                                    path.string());
    }
    try {
        return TabulatedGeometry(json::parse(file));
    } catch (const json::parse_error& e) {
        THROW_INVALID_CONFIGURATION("Cannot parse geometry table ",
                                    path.string(), ": ", e.what());
    }
}

GeometrySample TabulatedGeometry::sample(const std::string& observer,
                                         const std::string& target,
                                         const tools::TimePoint& time) const {
    if (observer != observer_) {
        THROW_GEOMETRY_UNAVAILABLE("No geometry for observer ", observer);
    }
    auto it = samples_.find(target);
    if (it == samples_.end()) {
        THROW_GEOMETRY_UNAVAILABLE("No geometry for target ", target);
    }
    const auto& rows = it->second;
    if (time < rows.front().time || time > rows.back().time) {
        THROW_GEOMETRY_UNAVAILABLE("Time ", tools::formatIsoTime(time),
                                   " is outside the table for ", target);
    }

    auto upper = std::upper_bound(
        rows.begin(), rows.end(), time,
        [](const tools::TimePoint& t, const GeometrySample& s) { return t < s.time; });
    if (upper == rows.end()) {
        return rows.back();
    }
    const auto& before = *(upper - 1);
    const auto& after = *upper;
    const double t = std::chrono::duration<double>(time - before.time).count() /
                     std::chrono::duration<double>(after.time - before.time).count();

    GeometrySample result;
    result.time = time;
    result.angularDiameter = lerp(before.angularDiameter, after.angularDiameter, t);
    result.nadirVelocity = lerp(before.nadirVelocity, after.nadirVelocity, t);
    result.distance = lerp(before.distance, after.distance, t);
    result.phaseAngle = lerp(before.phaseAngle, after.phaseAngle, t);
    return result;
}

double TabulatedGeometry::angularDiameter(const std::string& observer,
                                          const std::string& target,
                                          const tools::TimePoint& time) const {
    return sample(observer, target, time).angularDiameter;
}

geometry::Polygon TabulatedGeometry::illuminatedShape(
    const std::string& observer, const std::string& target,
    const tools::TimePoint& time, tools::AngularUnit unit) const {
    const auto row = sample(observer, target, time);
    const double radius = tools::convertAngle(row.angularDiameter / 2.0,
                                              tools::AngularUnit::Radians, unit);
    return litDiskOutline(radius, row.phaseAngle, outlineResolution_);
}

double TabulatedGeometry::nadirSurfaceVelocity(const std::string& observer,
                                               const std::string& target,
                                               const tools::TimePoint& time) const {
    const double velocity = sample(observer, target, time).nadirVelocity;
    if (!(velocity > 0.0)) {
        THROW_GEOMETRY_UNAVAILABLE("No nadir velocity tabulated for ", target);
    }
    return velocity;
}

double TabulatedGeometry::pixelFootprint(const std::string& observer,
                                         const std::string& target,
                                         const tools::TimePoint& time,
                                         double fovAngle, int fovPixels) const {
    if (fovPixels < 1) {
        THROW_INVALID_PARAMETER("Pixel count must be positive, got ", fovPixels);
    }
    const double distance = sample(observer, target, time).distance;
    if (!(distance > 0.0)) {
        THROW_GEOMETRY_UNAVAILABLE("No distance tabulated for ", target);
    }
    return distance * (fovAngle * tools::DEG_TO_RAD / fovPixels);
}

geometry::Polygon litDiskOutline(double radius, double phaseAngle,
                                 int resolution) {
    if (!(radius > 0.0)) {
        THROW_GEOMETRY_UNAVAILABLE("Target radius must be positive, got ", radius);
    }
    if (!(phaseAngle >= 0.0 && phaseAngle < MAX_PHASE_ANGLE_DEG)) {
        THROW_GEOMETRY_UNAVAILABLE("Target shows no lit area at phase angle ",
                                   phaseAngle);
    }

    const double terminator = -radius * std::cos(phaseAngle * tools::DEG_TO_RAD);
    std::vector<geometry::Point> vertices;
    vertices.reserve(static_cast<size_t>(2 * resolution));

    // Limb from the south pole through +x to the north pole
    for (int i = 0; i <= resolution; ++i) {
        const double theta = -tools::K_PI / 2.0 + tools::K_PI * i / resolution;
        vertices.push_back({radius * std::cos(theta), radius * std::sin(theta)});
    }
    // Terminator back down, poles excluded
    for (int i = resolution - 1; i >= 1; --i) {
        const double theta = -tools::K_PI / 2.0 + tools::K_PI * i / resolution;
        vertices.push_back({terminator * std::cos(theta), radius * std::sin(theta)});
    }
    return geometry::Polygon(std::move(vertices));
}

}  // namespace tessera::ephemeris
