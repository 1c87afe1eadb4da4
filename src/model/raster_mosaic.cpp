#include "raster_mosaic.hpp"

#include "exception/exception.hpp"
#include "planning/mosaic_layout.hpp"

namespace tessera::model {

RasterMosaic::RasterMosaic(ObservationContext context, RasterGrid grid)
    : Observation(std::move(context)), grid_(grid) {
    if (grid_.pointsX < 1 || grid_.pointsY < 1) {
        THROW_INVALID_PARAMETER("Mosaic needs at least one point per axis, got ",
                                grid_.pointsX, " x ", grid_.pointsY);
    }
    if (!(grid_.fovSize.width > 0.0) || !(grid_.fovSize.height > 0.0)) {
        THROW_INVALID_PARAMETER("FOV size must be positive");
    }
    if (!(grid_.dwellTime >= 0.0)) {
        THROW_INVALID_PARAMETER("Dwell time must be non-negative, got ",
                                grid_.dwellTime);
    }
    if (!(grid_.pointSlewTime >= 0.0) || !(grid_.lineSlewTime >= 0.0)) {
        THROW_INVALID_PARAMETER("Slew times must be non-negative");
    }
}

double RasterMosaic::duration() const {
    const int x = grid_.pointsX;
    const int y = grid_.pointsY;
    return (x - 1) * grid_.lineSlewTime + (y - 1) * x * grid_.pointSlewTime +
           grid_.dwellTime * x * y;
}

tools::TimePoint RasterMosaic::endTime() const {
    return blockEnd(std::chrono::minutes(1), std::chrono::minutes(1));
}

std::vector<geometry::Point> RasterMosaic::centerPoints() const {
    return planning::serpentineOrder(grid_.start, grid_.delta, grid_.pointsX,
                                     grid_.pointsY);
}

std::vector<geometry::Rectangle> RasterMosaic::rectangles() const {
    std::vector<geometry::Rectangle> frames;
    for (const auto& center : centerPoints()) {
        frames.emplace_back(center, grid_.fovSize);
    }
    return frames;
}

json RasterMosaic::toJson() const {
    json j = contextJson();
    j["type"] = "raster";
    j["fovSize"] = {grid_.fovSize.width, grid_.fovSize.height};
    j["start"] = {grid_.start.x, grid_.start.y};
    j["delta"] = {grid_.delta.x, grid_.delta.y};
    j["points"] = {grid_.pointsX, grid_.pointsY};
    j["dwellTime"] = grid_.dwellTime;
    j["pointSlewTime"] = grid_.pointSlewTime;
    j["lineSlewTime"] = grid_.lineSlewTime;
    return j;
}

}  // namespace tessera::model
