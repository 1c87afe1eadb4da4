/**
 * @file test_step_optimizer.cpp
 * @brief Unit tests for centered one-dimensional frame placement
 */

#include <gtest/gtest.h>

#include <cmath>

#include "exception/exception.hpp"
#include "planning/step_optimizer.hpp"

namespace tessera::planning::test {

class StepOptimizerTest : public ::testing::Test {
protected:
    static constexpr double EPSILON = 1e-9;

    static void expectPlan(const SteppingPlan& plan, int count, double start,
                           double step) {
        EXPECT_EQ(plan.count, count);
        EXPECT_NEAR(plan.start, start, EPSILON);
        EXPECT_NEAR(plan.step, step, EPSILON);
    }
};

// ============================================================================
// Known Placements
// ============================================================================

TEST_F(StepOptimizerTest, SingleFrameWhenSpanFits) {
    expectPlan(optimizeStepsCentered(0.9, 1.0, 0.0), 1, 0.0, 1.0);
    expectPlan(optimizeStepsCentered(1.0, 1.0, 0.5), 1, 0.0, 1.0);
}

TEST_F(StepOptimizerTest, EvenFrameCountStraddlesZero) {
    expectPlan(optimizeStepsCentered(1.8, 1.0, 0.0), 2, -0.4, 0.8);
}

TEST_F(StepOptimizerTest, OddFrameCountCentersOnZero) {
    expectPlan(optimizeStepsCentered(1.8, 1.0, 0.3), 3, -0.4, 0.4);
    expectPlan(optimizeStepsCentered(5.0, 1.0, 0.0), 5, -2.0, 1.0);
    expectPlan(optimizeStepsCentered(4.0, 1.0, 0.1), 5, -1.5, 0.75);
}

TEST_F(StepOptimizerTest, HighOverlapNeedsManyFrames) {
    expectPlan(optimizeStepsCentered(10.0, 1.0, 0.9), 91, -4.5, 0.1);
}

TEST_F(StepOptimizerTest, RoundingNoiseKeepsOneFrame) {
    expectPlan(optimizeStepsCentered(1.0 + 1e-9, 1.0, 0.0), 1, 0.0, 1.0);
}

// ============================================================================
// Properties
// ============================================================================

TEST_F(StepOptimizerTest, PlacementIsSymmetricAndCoversSpan) {
    const double width = 1.3;
    for (double diameter : {1.5, 2.7, 3.9, 7.25, 12.0}) {
        for (double overlap : {0.0, 0.1, 0.25, 0.6}) {
            const auto plan = optimizeStepsCentered(diameter, width, overlap);
            const double last = plan.start + (plan.count - 1) * plan.step;

            EXPECT_NEAR(plan.start, -last, EPSILON)
                << "d=" << diameter << " o=" << overlap;
            EXPECT_NEAR(plan.start - width / 2.0, -diameter / 2.0, EPSILON);
            EXPECT_LE(plan.step, width * (1.0 - overlap) + EPSILON);
            if (plan.count % 2 == 1) {
                EXPECT_NEAR(plan.start + (plan.count / 2) * plan.step, 0.0,
                            EPSILON);
            }
        }
    }
}

TEST_F(StepOptimizerTest, FewerFramesWouldLeaveGaps) {
    struct Case {
        double diameter;
        double width;
        double overlap;
        int count;
    };
    // Several cases divide exactly, so only the rounding bias keeps the
    // step count from growing by one
    const Case cases[] = {
        {1.8, 1.0, 0.0, 2},   {1.8, 1.0, 0.2, 2},  {1.8, 1.0, 0.3, 3},
        {5.0, 1.0, 0.0, 5},   {4.2, 1.0, 0.2, 5},  {3.4, 1.0, 0.4, 5},
        {10.0, 1.0, 0.9, 91}, {6.1, 1.0, 0.2, 8},  {2.7, 1.3, 0.25, 3},
        {12.0, 1.3, 0.6, 22},
    };

    for (const auto& c : cases) {
        SCOPED_TRACE(testing::Message() << "d=" << c.diameter << " w=" << c.width
                                        << " o=" << c.overlap);
        const auto plan = optimizeStepsCentered(c.diameter, c.width, c.overlap);
        EXPECT_EQ(plan.count, c.count);

        const double last = plan.start + (plan.count - 1) * plan.step;
        EXPECT_LE(plan.start - c.width / 2.0, -c.diameter / 2.0 + EPSILON);
        EXPECT_GE(last + c.width / 2.0, c.diameter / 2.0 - EPSILON);

        // One frame less, even at the widest allowed spacing
        const double effectiveFov = c.width * (1.0 - c.overlap);
        const double sparserSpan = c.width + (plan.count - 2) * effectiveFov;
        EXPECT_LT(sparserSpan, c.diameter);
    }
}

// ============================================================================
// Plan Helpers
// ============================================================================

TEST_F(StepOptimizerTest, ShiftedMovesStartOnly) {
    const SteppingPlan plan{3, -1.0, 1.0};
    EXPECT_EQ(plan.shifted(2.5), (SteppingPlan{3, 1.5, 1.0}));
    EXPECT_EQ(plan.shifted(0.0), plan);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(StepOptimizerTest, InvalidArgumentsThrow) {
    EXPECT_THROW((void)optimizeStepsCentered(5.0, 0.0, 0.1), InvalidParameter);
    EXPECT_THROW((void)optimizeStepsCentered(5.0, -1.0, 0.1), InvalidParameter);
    EXPECT_THROW((void)optimizeStepsCentered(5.0, 1.0, -0.3), InvalidParameter);
    EXPECT_THROW((void)optimizeStepsCentered(5.0, 1.0, 1.0), InvalidParameter);
    EXPECT_THROW((void)optimizeStepsCentered(NAN, 1.0, 0.1), InvalidParameter);
    EXPECT_THROW((void)optimizeStepsCentered(1e300, 1.0, 0.1), InvalidParameter);
    EXPECT_THROW((void)optimizeStepsCentered(1e12, 1e-3, 0.5), InvalidParameter);
}

}  // namespace tessera::planning::test
