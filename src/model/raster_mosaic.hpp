/**
 * @file raster_mosaic.hpp
 * @brief Regular grid mosaic covering the whole target disk.
 *
 * @date 2024-12-4
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_MODEL_RASTER_MOSAIC_HPP
#define TESSERA_MODEL_RASTER_MOSAIC_HPP

#include "observation.hpp"

namespace tessera::model {

/**
 * @brief Grid geometry and timing of a raster mosaic.
 */
struct RasterGrid {
    geometry::Size fovSize;
    geometry::Point start;
    geometry::Point delta;
    int pointsX = 1;
    int pointsY = 1;
    double dwellTime = 0.0;
    double pointSlewTime = 0.0;
    double lineSlewTime = 0.0;
};

/**
 * @brief Mosaic of pointsX columns by pointsY frames, visited serpentine.
 *
 * The block starts one minute before the first frame and ends one minute
 * after the last one.
 */
class RasterMosaic : public Observation {
public:
    /**
     * @throws InvalidParameter if a point count is below one, a time is
     * negative or the FOV is not positive
     */
    RasterMosaic(ObservationContext context, RasterGrid grid);

    [[nodiscard]] const RasterGrid& grid() const noexcept { return grid_; }
    [[nodiscard]] int frameCount() const noexcept {
        return grid_.pointsX * grid_.pointsY;
    }

    [[nodiscard]] double duration() const override;
    [[nodiscard]] tools::TimePoint endTime() const override;
    [[nodiscard]] std::vector<geometry::Point> centerPoints() const override;
    [[nodiscard]] std::vector<geometry::Rectangle> rectangles() const override;
    [[nodiscard]] json toJson() const override;

private:
    RasterGrid grid_;
};

}  // namespace tessera::model

#endif  // TESSERA_MODEL_RASTER_MOSAIC_HPP
