/**
 * @file test_tour_solver.cpp
 * @brief Unit tests for the nearest-neighbour and 2-opt tour heuristic
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>

#include "exception/exception.hpp"
#include "planning/tour_solver.hpp"

namespace tessera::planning::test {

class TourSolverTest : public ::testing::Test {
protected:
    static constexpr double EPSILON = 1e-9;

    static DistanceMatrix lineMatrix(const std::vector<double>& xs) {
        std::vector<geometry::Point> points;
        for (double x : xs) {
            points.push_back({x, 0.0});
        }
        return buildDistanceMatrix(points);
    }

    static bool isPermutation(std::vector<size_t> order, size_t n) {
        std::vector<size_t> expected(n);
        std::iota(expected.begin(), expected.end(), size_t{0});
        std::sort(order.begin(), order.end());
        return order == expected;
    }
};

// ============================================================================
// Distance Matrix
// ============================================================================

TEST_F(TourSolverTest, DistanceMatrixIsSymmetric) {
    const std::vector<geometry::Point> points{{0.0, 0.0}, {3.0, 4.0}, {0.0, 1.0}};
    const auto matrix = buildDistanceMatrix(points);
    ASSERT_EQ(matrix.size(), 3u);
    EXPECT_DOUBLE_EQ(matrix[0][1], 5.0);
    EXPECT_DOUBLE_EQ(matrix[1][0], 5.0);
    EXPECT_DOUBLE_EQ(matrix[2][2], 0.0);
}

TEST_F(TourSolverTest, PathLengthIsOpen) {
    const auto matrix = lineMatrix({0.0, 1.0, 3.0});
    const std::vector<size_t> order{0, 1, 2};
    EXPECT_NEAR(pathLength(matrix, order), 3.0, EPSILON);
}

// ============================================================================
// Nearest Neighbour
// ============================================================================

TEST_F(TourSolverTest, NearestNeighbourStartsAtFirstPoint) {
    const auto matrix = lineMatrix({0.0, 1.0, -1.5, 3.0});
    EXPECT_EQ(nearestNeighborTour(matrix), (std::vector<size_t>{0, 1, 3, 2}));
}

TEST_F(TourSolverTest, NearestNeighbourTiesPickLowestIndex) {
    const auto matrix = lineMatrix({0.0, 1.0, -1.0});
    EXPECT_EQ(nearestNeighborTour(matrix), (std::vector<size_t>{0, 1, 2}));
}

// ============================================================================
// Two-Opt Improvement
// ============================================================================

TEST_F(TourSolverTest, TwoOptRemovesBacktracking) {
    const auto matrix = lineMatrix({0.0, 1.0, -1.5, 3.0});
    const auto greedy = nearestNeighborTour(matrix);
    EXPECT_NEAR(pathLength(matrix, greedy), 7.5, EPSILON);

    const auto order = solveTour(matrix);
    EXPECT_TRUE(isPermutation(order, 4));
    EXPECT_NEAR(pathLength(matrix, order), 4.5, EPSILON);
}

TEST_F(TourSolverTest, ZeroPassesKeepsGreedyTour) {
    const auto matrix = lineMatrix({0.0, 1.0, -1.5, 3.0});
    EXPECT_EQ(solveTour(matrix, 0), nearestNeighborTour(matrix));
}

TEST_F(TourSolverTest, NeverLongerThanGreedyTour) {
    std::vector<geometry::Point> points;
    for (int i = 0; i < 5; ++i) {
        for (int j = 0; j < 4; ++j) {
            points.push_back({i * 1.7 + (j % 2) * 0.3, j * 1.2 - (i % 3) * 0.2});
        }
    }
    const auto matrix = buildDistanceMatrix(points);
    const auto order = solveTour(matrix);
    EXPECT_TRUE(isPermutation(order, points.size()));
    EXPECT_LE(pathLength(matrix, order),
              pathLength(matrix, nearestNeighborTour(matrix)) + EPSILON);
}

TEST_F(TourSolverTest, SmallInputsReturnIdentity) {
    EXPECT_TRUE(solveTour(DistanceMatrix{}).empty());
    EXPECT_EQ(solveTour(lineMatrix({4.0})), (std::vector<size_t>{0}));
    EXPECT_EQ(solveTour(lineMatrix({4.0, 1.0})), (std::vector<size_t>{0, 1}));
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(TourSolverTest, RejectsMalformedMatrix) {
    const DistanceMatrix ragged{{0.0, 1.0}, {1.0}};
    EXPECT_THROW((void)solveTour(ragged), InvalidParameter);

    const DistanceMatrix negative{{0.0, -1.0}, {-1.0, 0.0}};
    EXPECT_THROW((void)solveTour(negative), InvalidParameter);
}

}  // namespace tessera::planning::test
