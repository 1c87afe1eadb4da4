/**
 * @file polygon.hpp
 * @brief Planar points, sizes and polygons in the observer's angular frame.
 *
 * Coordinates are angles relative to the target's apparent center, with +x
 * pointing toward the Sun. The unit is whatever the caller chose for the
 * planning call.
 *
 * @date 2024-12-2
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_GEOMETRY_POLYGON_HPP
#define TESSERA_GEOMETRY_POLYGON_HPP

#include <vector>

#include <nlohmann/json.hpp>

namespace tessera::geometry {

using json = nlohmann::json;

/**
 * @brief A 2-D point in angular coordinates.
 */
struct Point {
    double x = 0.0;
    double y = 0.0;

    [[nodiscard]] bool operator==(const Point& other) const = default;
};

/**
 * @brief Width and height of a frame.
 */
struct Size {
    double width = 0.0;
    double height = 0.0;

    [[nodiscard]] bool operator==(const Size& other) const = default;
};

/**
 * @brief Axis-aligned bounding box.
 */
struct Bounds {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;

    [[nodiscard]] double width() const noexcept { return maxX - minX; }
    [[nodiscard]] double height() const noexcept { return maxY - minY; }
    [[nodiscard]] double centerX() const noexcept { return (maxX + minX) / 2.0; }
    [[nodiscard]] double centerY() const noexcept { return (maxY + minY) / 2.0; }
};

/// Euclidean distance between two points
[[nodiscard]] double distance(const Point& a, const Point& b) noexcept;

/**
 * @brief Simple polygon given by its vertices in order.
 *
 * The closing edge from the last vertex back to the first is implicit.
 */
class Polygon {
public:
    /**
     * @brief Construct a polygon.
     * @param vertices At least three finite vertices
     * @throws InvalidParameter on fewer than three or non-finite vertices
     */
    explicit Polygon(std::vector<Point> vertices);

    [[nodiscard]] const std::vector<Point>& vertices() const noexcept {
        return vertices_;
    }

    [[nodiscard]] size_t size() const noexcept { return vertices_.size(); }

    [[nodiscard]] Bounds bounds() const noexcept;

    /// Unsigned area (shoelace formula)
    [[nodiscard]] double area() const noexcept;

    /**
     * @brief Check whether two polygons share a region of positive area.
     *
     * True for partial overlap and for either polygon containing the other.
     * Polygons that only touch along an edge or at a vertex do not overlap.
     */
    [[nodiscard]] bool overlaps(const Polygon& other) const;

    [[nodiscard]] json toJson() const;

    /**
     * @brief Build a polygon from a JSON array of [x, y] pairs.
     * @throws InvalidParameter if the array is malformed
     */
    [[nodiscard]] static Polygon fromJson(const json& j);

private:
    std::vector<Point> vertices_;
};

}  // namespace tessera::geometry

#endif  // TESSERA_GEOMETRY_POLYGON_HPP
