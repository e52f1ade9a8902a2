#include "knowmap/assignment.hpp"
#include "knowmap/error.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <tuple>

namespace knowmap {

Eigen::MatrixXd distance_matrix(const PointSet& sources, const PointSet& targets) {
    Eigen::MatrixXd cost(static_cast<Eigen::Index>(sources.size()),
                         static_cast<Eigen::Index>(targets.size()));
    for (size_t i = 0; i < sources.size(); ++i) {
        for (size_t j = 0; j < targets.size(); ++j) {
            cost(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = distance(sources[i], targets[j]);
        }
    }
    return cost;
}

// =============================================================================
// Hungarian
// =============================================================================

std::vector<size_t> HungarianAssigner::solve(const Eigen::MatrixXd& cost) {
    const size_t n = static_cast<size_t>(cost.rows());
    const size_t m = static_cast<size_t>(cost.cols());
    if (n > m) {
        throw InvalidParameterError("targets", "at least as many targets as sources", __func__);
    }
    if (n == 0) return {};
    if (!cost.allFinite()) {
        throw NumericalError("assignment cost matrix contains non-finite entries", __func__);
    }

    const double INF = std::numeric_limits<double>::infinity();

    // 1-based potentials; p[j] = row matched to column j (0 = free)
    std::vector<double> u(n + 1, 0.0), v(m + 1, 0.0);
    std::vector<size_t> p(m + 1, 0), way(m + 1, 0);
    std::vector<double> minv(m + 1);
    std::vector<char> used(m + 1);

    for (size_t i = 1; i <= n; ++i) {
        p[0] = i;
        size_t j0 = 0;
        std::fill(minv.begin(), minv.end(), INF);
        std::fill(used.begin(), used.end(), 0);

        do {
            used[j0] = 1;
            const size_t i0 = p[j0];
            double delta = INF;
            size_t j1 = 0;

            for (size_t j = 1; j <= m; ++j) {
                if (used[j]) continue;
                const double cur = cost(static_cast<Eigen::Index>(i0 - 1), static_cast<Eigen::Index>(j - 1)) - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }
            if (j1 == 0) {
                throw NumericalError("no augmenting path in assignment cost matrix", __func__);
            }

            for (size_t j = 0; j <= m; ++j) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j] -= delta;
                } else {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (p[j0] != 0);

        // Augment along the alternating path
        do {
            const size_t j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0 != 0);
    }

    std::vector<size_t> col_of_row(n, constants::UNASSIGNED);
    for (size_t j = 1; j <= m; ++j) {
        if (p[j] != 0) col_of_row[p[j] - 1] = j - 1;
    }
    return col_of_row;
}

Assignment HungarianAssigner::assign(const PointSet& sources, const PointSet& targets) const {
    const Eigen::MatrixXd cost = distance_matrix(sources, targets);

    Assignment out;
    out.target_of = solve(cost);
    for (size_t i = 0; i < out.target_of.size(); ++i) {
        out.total_cost += cost(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(out.target_of[i]));
    }
    return out;
}

// =============================================================================
// Greedy + pairwise swaps
// =============================================================================

Assignment GreedyAssigner::assign(const PointSet& sources, const PointSet& targets) const {
    const size_t n = sources.size();
    const size_t m = targets.size();
    if (n > m) {
        throw InvalidParameterError("targets", "at least as many targets as sources", __func__);
    }

    Assignment out;
    out.target_of.assign(n, constants::UNASSIGNED);
    if (n == 0) return out;

    // (cost, source, target); sort is total so ties resolve by lower indices
    std::vector<std::tuple<double, size_t, size_t>> pairs;
    pairs.reserve(n * m);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < m; ++j) {
            pairs.emplace_back(distance(sources[i], targets[j]), i, j);
        }
    }
    std::sort(pairs.begin(), pairs.end());

    std::vector<char> target_taken(m, 0);
    size_t matched = 0;
    for (const auto& [c, i, j] : pairs) {
        if (out.target_of[i] != constants::UNASSIGNED || target_taken[j]) continue;
        out.target_of[i] = j;
        target_taken[j] = 1;
        if (++matched == n) break;
    }

    // 2-opt: swap targets of a pair of sources whenever that lowers the cost
    for (int pass = 0; pass < max_passes_; ++pass) {
        bool improved = false;
        for (size_t a = 0; a < n; ++a) {
            for (size_t b = a + 1; b < n; ++b) {
                const Point2D& ta = targets[out.target_of[a]];
                const Point2D& tb = targets[out.target_of[b]];
                const double current = distance(sources[a], ta) + distance(sources[b], tb);
                const double swapped = distance(sources[a], tb) + distance(sources[b], ta);
                if (swapped < current - 1e-12) {
                    std::swap(out.target_of[a], out.target_of[b]);
                    improved = true;
                }
            }
        }
        if (!improved) break;
    }

    for (size_t i = 0; i < n; ++i) {
        out.total_cost += distance(sources[i], targets[out.target_of[i]]);
    }
    return out;
}

} // namespace knowmap
