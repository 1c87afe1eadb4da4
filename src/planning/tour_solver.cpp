#include "tour_solver.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "tools/constants.hpp"

namespace tessera::planning {

namespace {

void validateMatrix(const DistanceMatrix& distances) {
    const size_t n = distances.size();
    for (size_t i = 0; i < n; ++i) {
        if (distances[i].size() != n) {
            THROW_INVALID_PARAMETER("Distance matrix is not square: row ", i,
                                    " has ", distances[i].size(),
                                    " entries, expected ", n);
        }
        for (double value : distances[i]) {
            if (!(value >= 0.0) || !std::isfinite(value)) {
                THROW_INVALID_PARAMETER("Distance matrix row ", i,
                                        " has an invalid entry ", value);
            }
        }
    }
}

/**
 * @brief Length saved by reversing order[i..j] in an open path.
 */
double reversalGain(const DistanceMatrix& d, const std::vector<size_t>& order,
                    size_t i, size_t j) {
    const size_t last = order.size() - 1;
    double before = 0.0;
    double after = 0.0;
    if (i > 0) {
        before += d[order[i - 1]][order[i]];
        after += d[order[i - 1]][order[j]];
    }
    if (j < last) {
        before += d[order[j]][order[j + 1]];
        after += d[order[i]][order[j + 1]];
    }
    return before - after;
}

}  // namespace

DistanceMatrix buildDistanceMatrix(std::span<const geometry::Point> points) {
    DistanceMatrix matrix(points.size(), std::vector<double>(points.size(), 0.0));
    for (size_t i = 0; i < points.size(); ++i) {
        for (size_t j = i + 1; j < points.size(); ++j) {
            const double value = geometry::distance(points[i], points[j]);
            matrix[i][j] = value;
            matrix[j][i] = value;
        }
    }
    return matrix;
}

double pathLength(const DistanceMatrix& distances, std::span<const size_t> order) {
    double total = 0.0;
    for (size_t k = 1; k < order.size(); ++k) {
        total += distances[order[k - 1]][order[k]];
    }
    return total;
}

std::vector<size_t> nearestNeighborTour(const DistanceMatrix& distances) {
    const size_t n = distances.size();
    std::vector<size_t> order;
    order.reserve(n);
    if (n == 0) {
        return order;
    }

    std::vector<bool> used(n, false);
    size_t current = 0;
    used[current] = true;
    order.push_back(current);

    while (order.size() < n) {
        double minDistance = std::numeric_limits<double>::max();
        size_t nextIdx = n;
        for (size_t i = 0; i < n; ++i) {
            if (!used[i] && distances[current][i] < minDistance) {
                minDistance = distances[current][i];
                nextIdx = i;
            }
        }
        used[nextIdx] = true;
        order.push_back(nextIdx);
        current = nextIdx;
    }
    return order;
}

std::vector<size_t> solveTour(const DistanceMatrix& distances,
                              int optimizationPasses) {
    validateMatrix(distances);
    const size_t n = distances.size();
    if (n <= 2) {
        std::vector<size_t> identity(n);
        std::iota(identity.begin(), identity.end(), size_t{0});
        return identity;
    }

    auto order = nearestNeighborTour(distances);
    [[maybe_unused]] const double initialLength = pathLength(distances, order);

    int passesUsed = 0;
    for (int pass = 0; pass < optimizationPasses; ++pass) {
        bool improved = false;
        for (size_t i = 0; i + 1 < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                if (i == 0 && j == n - 1) {
                    continue;
                }
                if (reversalGain(distances, order, i, j) >
                    tools::TOUR_GAIN_EPSILON) {
                    std::reverse(order.begin() + static_cast<std::ptrdiff_t>(i),
                                 order.begin() + static_cast<std::ptrdiff_t>(j) + 1);
                    improved = true;
                }
            }
        }
        ++passesUsed;
        if (!improved) {
            break;
        }
    }

    SPDLOG_DEBUG("solveTour: {} points, length {:.6f} -> {:.6f} after {} passes",
                 n, initialLength, pathLength(distances, order), passesUsed);
    return order;
}

}  // namespace tessera::planning
