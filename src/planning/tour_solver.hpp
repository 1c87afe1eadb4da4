/**
 * @file tour_solver.hpp
 * @brief Heuristic shortest open tour over a set of frame centers.
 *
 * @date 2024-12-3
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_PLANNING_TOUR_SOLVER_HPP
#define TESSERA_PLANNING_TOUR_SOLVER_HPP

#include <span>
#include <vector>

#include "geometry/polygon.hpp"

namespace tessera::planning {

using DistanceMatrix = std::vector<std::vector<double>>;

/// Default number of 2-opt passes applied after construction
inline constexpr int DEFAULT_TOUR_PASSES = 10;

/**
 * @brief Pairwise Euclidean distances between points.
 */
[[nodiscard]] DistanceMatrix buildDistanceMatrix(
    std::span<const geometry::Point> points);

/**
 * @brief Length of an open path visiting indices in the given order.
 */
[[nodiscard]] double pathLength(const DistanceMatrix& distances,
                                std::span<const size_t> order);

/**
 * @brief Greedy nearest-neighbor path starting at index 0.
 *
 * Ties are broken by the lowest index.
 */
[[nodiscard]] std::vector<size_t> nearestNeighborTour(
    const DistanceMatrix& distances);

/**
 * @brief Approximate shortest open path through every index.
 *
 * Builds a nearest-neighbor path from index 0, then runs up to
 * optimizationPasses rounds of 2-opt segment reversal, applying every
 * strictly improving move found. Stops early after a round with no
 * improvement. The matrix is assumed symmetric.
 *
 * @param distances Square matrix of non-negative distances
 * @param optimizationPasses Maximum number of improvement rounds
 * @return Permutation of [0, n)
 * @throws InvalidParameter if the matrix is not square or has negative entries
 */
[[nodiscard]] std::vector<size_t> solveTour(
    const DistanceMatrix& distances,
    int optimizationPasses = DEFAULT_TOUR_PASSES);

}  // namespace tessera::planning

#endif  // TESSERA_PLANNING_TOUR_SOLVER_HPP
