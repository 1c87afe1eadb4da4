#include "scan.hpp"

#include <cmath>

#include "exception/exception.hpp"

namespace tessera::model {

Scan::Scan(ObservationContext context, ScanGeometry lines)
    : Observation(std::move(context)), geometry_(lines) {
    if (!(geometry_.fovWidth > 0.0)) {
        THROW_INVALID_PARAMETER("FOV width must be positive, got ",
                                geometry_.fovWidth);
    }
    if (!(geometry_.scanSlewRate > 0.0)) {
        THROW_INVALID_PARAMETER("Scan slew rate must be positive, got ",
                                geometry_.scanSlewRate);
    }
    if (!(geometry_.lineSlewTime > 0.0)) {
        THROW_INVALID_PARAMETER("Line slew time must be positive, got ",
                                geometry_.lineSlewTime);
    }
    if (!(geometry_.borderSlewTime > 0.0)) {
        THROW_INVALID_PARAMETER("Border slew time must be positive, got ",
                                geometry_.borderSlewTime);
    }
    if (geometry_.numberOfLines < 1) {
        THROW_INVALID_PARAMETER("Scan needs at least one line, got ",
                                geometry_.numberOfLines);
    }
}

double Scan::duration() const {
    const int lines = geometry_.numberOfLines;
    return 2.0 * geometry_.borderSlewTime +
           lines * std::abs(geometry_.delta.y) / geometry_.scanSlewRate +
           (lines - 1) * geometry_.lineSlewTime;
}

tools::TimePoint Scan::endTime() const {
    return blockEnd(std::chrono::seconds(10), std::chrono::minutes(1));
}

std::vector<geometry::Point> Scan::centerPoints() const {
    std::vector<geometry::Point> points;
    points.reserve(static_cast<size_t>(geometry_.numberOfLines));
    const double y = geometry_.start.y + geometry_.delta.y / 2.0;
    for (int i = 0; i < geometry_.numberOfLines; ++i) {
        points.push_back({geometry_.start.x + i * geometry_.delta.x, y});
    }
    return points;
}

std::vector<geometry::Rectangle> Scan::rectangles() const {
    const geometry::Size size{geometry_.fovWidth, std::abs(geometry_.delta.y)};
    std::vector<geometry::Rectangle> frames;
    for (const auto& center : centerPoints()) {
        frames.emplace_back(center, size);
    }
    return frames;
}

json Scan::toJson() const {
    json j = contextJson();
    j["type"] = "scan";
    j["fovWidth"] = geometry_.fovWidth;
    j["scanSlewRate"] = geometry_.scanSlewRate;
    j["lineSlewTime"] = geometry_.lineSlewTime;
    j["borderSlewTime"] = geometry_.borderSlewTime;
    j["start"] = {geometry_.start.x, geometry_.start.y};
    j["delta"] = {geometry_.delta.x, geometry_.delta.y};
    j["numberOfLines"] = geometry_.numberOfLines;
    return j;
}

}  // namespace tessera::model
