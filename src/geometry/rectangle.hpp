/**
 * @file rectangle.hpp
 * @brief Axis-aligned frame rectangle.
 *
 * @date 2024-12-2
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_GEOMETRY_RECTANGLE_HPP
#define TESSERA_GEOMETRY_RECTANGLE_HPP

#include <array>
#include <cstdint>

#include "polygon.hpp"

namespace tessera::geometry {

/**
 * @brief How the anchor point of a rectangle is interpreted.
 */
enum class AnchorMode : uint8_t {
    Center,  ///< Anchor is the rectangle's center
    Corner   ///< Anchor is the lower-left corner
};

/**
 * @brief Immutable axis-aligned rectangle, typically one instrument frame.
 */
class Rectangle {
public:
    /**
     * @brief Construct a rectangle.
     * @param anchor Center or lower-left corner, according to mode
     * @param size Width and height, both strictly positive
     * @param mode Interpretation of anchor
     * @throws InvalidParameter if a dimension is not positive
     */
    Rectangle(const Point& anchor, const Size& size,
              AnchorMode mode = AnchorMode::Center);

    [[nodiscard]] const Point& center() const noexcept { return center_; }
    [[nodiscard]] const Size& size() const noexcept { return size_; }

    [[nodiscard]] Bounds bounds() const noexcept;

    /// Corners counter-clockwise from the lower-left one
    [[nodiscard]] std::array<Point, 4> corners() const noexcept;

    [[nodiscard]] Polygon toPolygon() const;

    [[nodiscard]] json toJson() const;

    [[nodiscard]] bool operator==(const Rectangle& other) const = default;

private:
    Point center_;
    Size size_;
};

}  // namespace tessera::geometry

#endif  // TESSERA_GEOMETRY_RECTANGLE_HPP
