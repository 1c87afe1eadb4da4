#include "custom_mosaic.hpp"

#include <numeric>

#include "exception/exception.hpp"

namespace tessera::model {

CustomMosaic::CustomMosaic(ObservationContext context,
                           const geometry::Size& fovSize, double dwellTime,
                           double slewRate, std::vector<geometry::Point> points)
    : Observation(std::move(context)),
      fovSize_(fovSize),
      dwellTime_(dwellTime),
      slewRate_(slewRate),
      points_(std::move(points)) {
    if (points_.empty()) {
        THROW_INVALID_PARAMETER("Custom mosaic needs at least one point");
    }
    if (!(fovSize_.width > 0.0) || !(fovSize_.height > 0.0)) {
        THROW_INVALID_PARAMETER("FOV size must be positive");
    }
    if (!(dwellTime_ >= 0.0)) {
        THROW_INVALID_PARAMETER("Dwell time must be non-negative, got ",
                                dwellTime_);
    }
    if (!(slewRate_ > 0.0)) {
        THROW_INVALID_PARAMETER("Slew rate must be positive, got ", slewRate_);
    }
}

std::vector<double> CustomMosaic::slewTimes() const {
    std::vector<double> times;
    times.reserve(points_.size());
    for (size_t i = 0; i + 1 < points_.size(); ++i) {
        times.push_back(geometry::distance(points_[i], points_[i + 1]) /
                        slewRate_);
    }
    times.push_back(0.0);
    return times;
}

double CustomMosaic::duration() const {
    const auto slews = slewTimes();
    return std::accumulate(slews.begin(), slews.end(), 0.0) +
           dwellTime_ * static_cast<double>(points_.size());
}

tools::TimePoint CustomMosaic::endTime() const {
    return blockEnd(std::chrono::minutes(1), std::chrono::minutes(1));
}

std::vector<geometry::Rectangle> CustomMosaic::rectangles() const {
    std::vector<geometry::Rectangle> frames;
    frames.reserve(points_.size());
    for (const auto& center : points_) {
        frames.emplace_back(center, fovSize_);
    }
    return frames;
}

json CustomMosaic::toJson() const {
    json j = contextJson();
    j["type"] = "custom";
    j["fovSize"] = {fovSize_.width, fovSize_.height};
    j["dwellTime"] = dwellTime_;
    j["slewRate"] = slewRate_;
    json points = json::array();
    for (const auto& point : points_) {
        points.push_back({point.x, point.y});
    }
    j["points"] = std::move(points);
    return j;
}

}  // namespace tessera::model
