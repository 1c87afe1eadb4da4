#include "polygon.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include <clipper2/clipper.h>

#include "exception/exception.hpp"

namespace tessera::geometry {

namespace {

// Fixed-point scale used when handing coordinates to Clipper2
constexpr double CLIPPER_SCALE = 1e9;

Clipper2Lib::Paths64 toClipperPaths(const Polygon& polygon) {
    Clipper2Lib::Path64 path;
    path.reserve(polygon.size());
    for (const auto& vertex : polygon.vertices()) {
        path.push_back(Clipper2Lib::Point64(
            static_cast<int64_t>(std::llround(vertex.x * CLIPPER_SCALE)),
            static_cast<int64_t>(std::llround(vertex.y * CLIPPER_SCALE))));
    }
    Clipper2Lib::Paths64 paths;
    paths.push_back(std::move(path));
    return paths;
}

}  // namespace

double distance(const Point& a, const Point& b) noexcept {
    return std::hypot(a.x - b.x, a.y - b.y);
}

Polygon::Polygon(std::vector<Point> vertices) : vertices_(std::move(vertices)) {
    if (vertices_.size() < 3) {
        THROW_INVALID_PARAMETER("Polygon needs at least 3 vertices, got ",
                                vertices_.size());
    }
    for (const auto& vertex : vertices_) {
        if (!std::isfinite(vertex.x) || !std::isfinite(vertex.y)) {
            THROW_INVALID_PARAMETER("Polygon vertex is not finite");
        }
    }
}

Bounds Polygon::bounds() const noexcept {
    Bounds box{vertices_.front().x, vertices_.front().y, vertices_.front().x,
               vertices_.front().y};
    for (const auto& vertex : vertices_) {
        box.minX = std::min(box.minX, vertex.x);
        box.minY = std::min(box.minY, vertex.y);
        box.maxX = std::max(box.maxX, vertex.x);
        box.maxY = std::max(box.maxY, vertex.y);
    }
    return box;
}

double Polygon::area() const noexcept {
    double twiceArea = 0.0;
    for (size_t i = 0; i < vertices_.size(); ++i) {
        const auto& a = vertices_[i];
        const auto& b = vertices_[(i + 1) % vertices_.size()];
        twiceArea += a.x * b.y - b.x * a.y;
    }
    return std::abs(twiceArea) / 2.0;
}

bool Polygon::overlaps(const Polygon& other) const {
    const auto subject = toClipperPaths(*this);
    const auto clip = toClipperPaths(other);
    const auto common =
        Clipper2Lib::Intersect(subject, clip, Clipper2Lib::FillRule::NonZero);
    return !common.empty() && std::abs(Clipper2Lib::Area(common)) > 0.0;
}

json Polygon::toJson() const {
    json j = json::array();
    for (const auto& vertex : vertices_) {
        j.push_back({vertex.x, vertex.y});
    }
    return j;
}

Polygon Polygon::fromJson(const json& j) {
    if (!j.is_array()) {
        THROW_INVALID_PARAMETER("Polygon must be a JSON array of [x, y] pairs");
    }
    std::vector<Point> vertices;
    vertices.reserve(j.size());
    for (const auto& item : j) {
        if (!item.is_array() || item.size() != 2 || !item[0].is_number() ||
            !item[1].is_number()) {
            THROW_INVALID_PARAMETER("Polygon vertex must be a [x, y] pair: ",
                                    item.dump());
        }
        vertices.push_back({item[0].get<double>(), item[1].get<double>()});
    }
    return Polygon(std::move(vertices));
}

}  // namespace tessera::geometry
