/**
 * @file custom_mosaic.hpp
 * @brief Mosaic with an explicit, ordered list of pointings.
 *
 * @date 2024-12-4
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_MODEL_CUSTOM_MOSAIC_HPP
#define TESSERA_MODEL_CUSTOM_MOSAIC_HPP

#include "observation.hpp"

namespace tessera::model {

/**
 * @brief Mosaic visiting arbitrary frame centers in list order.
 *
 * Slewing between consecutive centers takes their Euclidean distance
 * divided by the slew rate.
 */
class CustomMosaic : public Observation {
public:
    /**
     * @param context Target, start time and units
     * @param fovSize Frame size
     * @param dwellTime Time spent at each center, >= 0
     * @param slewRate Angle per time unit, > 0
     * @param points Ordered frame centers, non-empty
     * @throws InvalidParameter on any violated bound
     */
    CustomMosaic(ObservationContext context, const geometry::Size& fovSize,
                 double dwellTime, double slewRate,
                 std::vector<geometry::Point> points);

    [[nodiscard]] const geometry::Size& fovSize() const noexcept {
        return fovSize_;
    }
    [[nodiscard]] double dwellTime() const noexcept { return dwellTime_; }
    [[nodiscard]] double slewRate() const noexcept { return slewRate_; }
    [[nodiscard]] size_t frameCount() const noexcept { return points_.size(); }

    /// Slew time after each point; the last entry is zero
    [[nodiscard]] std::vector<double> slewTimes() const;

    [[nodiscard]] double duration() const override;
    [[nodiscard]] tools::TimePoint endTime() const override;
    [[nodiscard]] std::vector<geometry::Point> centerPoints() const override {
        return points_;
    }
    [[nodiscard]] std::vector<geometry::Rectangle> rectangles() const override;
    [[nodiscard]] json toJson() const override;

private:
    geometry::Size fovSize_;
    double dwellTime_;
    double slewRate_;
    std::vector<geometry::Point> points_;
};

}  // namespace tessera::model

#endif  // TESSERA_MODEL_CUSTOM_MOSAIC_HPP
