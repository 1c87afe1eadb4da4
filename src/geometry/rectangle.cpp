#include "rectangle.hpp"

#include <cmath>

#include "exception/exception.hpp"

namespace tessera::geometry {

Rectangle::Rectangle(const Point& anchor, const Size& size, AnchorMode mode)
    : size_(size) {
    if (!(size.width > 0.0) || !(size.height > 0.0) ||
        !std::isfinite(size.width) || !std::isfinite(size.height)) {
        THROW_INVALID_PARAMETER("Rectangle size must be positive, got ",
                                size.width, " x ", size.height);
    }
    if (mode == AnchorMode::Corner) {
        center_ = {anchor.x + size.width / 2.0, anchor.y + size.height / 2.0};
    } else {
        center_ = anchor;
    }
}

Bounds Rectangle::bounds() const noexcept {
    const double halfWidth = size_.width / 2.0;
    const double halfHeight = size_.height / 2.0;
    return {center_.x - halfWidth, center_.y - halfHeight,
            center_.x + halfWidth, center_.y + halfHeight};
}

std::array<Point, 4> Rectangle::corners() const noexcept {
    const auto box = bounds();
    return {Point{box.minX, box.minY}, Point{box.maxX, box.minY},
            Point{box.maxX, box.maxY}, Point{box.minX, box.maxY}};
}

Polygon Rectangle::toPolygon() const {
    const auto points = corners();
    return Polygon(std::vector<Point>(points.begin(), points.end()));
}

json Rectangle::toJson() const {
    return {{"center", {center_.x, center_.y}},
            {"size", {size_.width, size_.height}}};
}

}  // namespace tessera::geometry
