#pragma once

/**
 * One-to-one assignment of source points to target slots
 *
 * Minimises total Euclidean displacement. Used once per cluster (patched
 * method) or once over the representative subsample (subsample method).
 */

#include "knowmap/types.hpp"

#include <Eigen/Dense>

#include <memory>
#include <string>
#include <vector>

namespace knowmap {

struct Assignment {
    std::vector<size_t> target_of;   // target index for each source, distinct
    double total_cost = 0.0;         // sum of Euclidean source->target distances
};

/**
 * Assignment strategy: sources x targets -> one-to-one mapping.
 * Requires sources.size() <= targets.size(); every source gets a distinct target.
 */
class Assigner {
public:
    virtual ~Assigner() = default;

    virtual Assignment assign(const PointSet& sources, const PointSet& targets) const = 0;

    virtual std::string name() const = 0;
};

/**
 * Exact minimum-cost assignment (Hungarian method, shortest augmenting
 * paths with potentials), O(n^2 m). Among equal-cost optima it returns the
 * first one the augmentation order discovers.
 */
class HungarianAssigner : public Assigner {
public:
    Assignment assign(const PointSet& sources, const PointSet& targets) const override;

    std::string name() const override { return "hungarian"; }

    // Solve on an explicit rows x cols cost matrix (rows <= cols).
    // Returns the column assigned to each row.
    static std::vector<size_t> solve(const Eigen::MatrixXd& cost);
};

/**
 * Greedy cheapest-pair matching followed by pairwise-swap local improvement.
 * Approximate, O(n m log(n m)) for the greedy pass; for clusters too large
 * for the exact solver.
 */
class GreedyAssigner : public Assigner {
public:
    explicit GreedyAssigner(int max_improvement_passes = 8)
        : max_passes_(max_improvement_passes) {}

    Assignment assign(const PointSet& sources, const PointSet& targets) const override;

    std::string name() const override { return "greedy"; }

private:
    int max_passes_;
};

// Euclidean cost matrix, sources as rows and targets as columns
Eigen::MatrixXd distance_matrix(const PointSet& sources, const PointSet& targets);

} // namespace knowmap
