/**
 * @file step_optimizer.hpp
 * @brief Centered one-dimensional frame placement.
 *
 * @date 2024-12-3
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_PLANNING_STEP_OPTIMIZER_HPP
#define TESSERA_PLANNING_STEP_OPTIMIZER_HPP

namespace tessera::planning {

/**
 * @brief Evenly spaced frame positions along one axis.
 *
 * Frame i sits at start + i * step for i in [0, count).
 */
struct SteppingPlan {
    int count = 1;
    double start = 0.0;
    double step = 1.0;

    /// Same plan moved by offset
    [[nodiscard]] SteppingPlan shifted(double offset) const noexcept;

    [[nodiscard]] bool operator==(const SteppingPlan& other) const = default;
};

/**
 * @brief Place the fewest frames that cover a span centered on zero.
 *
 * One frame suffices when the span is no wider than a frame; the returned
 * step is then a placeholder of 1.0. Otherwise the number of steps n is
 * the smallest integer keeping adjacent frames at least min_overlap apart.
 * An odd n yields an even frame count with no frame on zero; an even n
 * yields an odd frame count with one frame exactly on zero.
 *
 * @param diameterToCover Width of the span [-d/2, d/2]
 * @param frameWidth Width of one frame, strictly positive
 * @param minOverlap Fractional overlap between neighbours, in [0, 1)
 * @return Count, first position and step of the placement
 * @throws InvalidParameter on a non-positive frame or overlap out of range
 */
[[nodiscard]] SteppingPlan optimizeStepsCentered(double diameterToCover,
                                                 double frameWidth,
                                                 double minOverlap);

}  // namespace tessera::planning

#endif  // TESSERA_PLANNING_STEP_OPTIMIZER_HPP
