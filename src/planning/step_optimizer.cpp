#include "step_optimizer.hpp"

#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "tools/constants.hpp"

namespace tessera::planning {

SteppingPlan SteppingPlan::shifted(double offset) const noexcept {
    return {count, start + offset, step};
}

SteppingPlan optimizeStepsCentered(double diameterToCover, double frameWidth,
                                   double minOverlap) {
    if (!(frameWidth > 0.0) || !std::isfinite(frameWidth)) {
        THROW_INVALID_PARAMETER("Frame width must be positive, got ",
                                frameWidth);
    }
    if (!(minOverlap >= 0.0 && minOverlap < 1.0)) {
        THROW_INVALID_PARAMETER("Overlap must be in [0, 1), got ", minOverlap);
    }
    if (!std::isfinite(diameterToCover)) {
        THROW_INVALID_PARAMETER("Diameter to cover is not finite");
    }

    if (diameterToCover <= frameWidth) {
        return {1, 0.0, 1.0};
    }

    const double effectiveFov = frameWidth * (1.0 - minOverlap);
    const double rawSteps = std::ceil((diameterToCover - frameWidth) / effectiveFov -
                                      tools::STEP_COUNT_EPSILON);
    if (rawSteps >= static_cast<double>(std::numeric_limits<int>::max())) {
        THROW_INVALID_PARAMETER("Diameter ", diameterToCover,
                                " needs too many frames of width ", frameWidth);
    }
    const int steps = static_cast<int>(rawSteps);
    if (steps < 1) {
        // Wider than the frame only by rounding noise
        return {1, 0.0, 1.0};
    }

    SteppingPlan plan;
    const double first = -diameterToCover / 2.0 + frameWidth / 2.0;
    if (steps % 2 == 1) {
        // Even number of frames straddling zero
        const double last = -first;
        plan = {steps + 1, first, (last - first) / steps};
    } else {
        // Odd number of frames, middle one on zero
        plan = {steps + 1, first, (0.0 - first) / (steps / 2)};
    }

    SPDLOG_DEBUG("optimizeStepsCentered: d={:.6f}, w={:.6f}, o={:.3f} -> "
                 "count={}, start={:.6f}, step={:.6f}",
                 diameterToCover, frameWidth, minOverlap, plan.count,
                 plan.start, plan.step);
    return plan;
}

}  // namespace tessera::planning
