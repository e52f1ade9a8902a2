#pragma once

/**
 * Seeded 2D clustering
 *
 * Groups primary points into local density neighbourhoods. Each cluster later
 * receives its own target region and its own assignment problem, so the only
 * hard requirements are: every cluster is non-empty, and the partition is a
 * pure function of (points, k, seed).
 */

#include "knowmap/types.hpp"
#include "knowmap/rng.hpp"

#include <memory>
#include <string>
#include <vector>

namespace knowmap {

struct ClusterAssignment {
    std::vector<size_t> labels;    // cluster index per point
    PointSet centroids;            // k centroids
    std::vector<size_t> sizes;     // points per cluster, all > 0
    double inertia = 0.0;          // sum of squared distances to centroids
    int iterations = 0;

    size_t cluster_count() const { return centroids.size(); }

    // Indices of the points in cluster c, in ascending order
    std::vector<size_t> members(size_t c) const;
};

/**
 * Clustering strategy: points x k -> cluster assignment.
 * Implementations must throw DegenerateInputError when k non-empty clusters
 * cannot be formed.
 */
class Clusterer {
public:
    virtual ~Clusterer() = default;

    virtual ClusterAssignment cluster(const PointSet& points, size_t k, Rng& rng) const = 0;

    virtual std::string name() const = 0;
};

struct KMeansConfig {
    int max_iterations = 100;
    int restarts = 3;              // best of n runs by inertia
    double tolerance = 1e-9;       // stop when no centroid moves further than this
};

/**
 * Lloyd's k-means with k-means++ seeding.
 *
 * Nearest-centroid ties go to the lower cluster index. A cluster that runs
 * empty is refilled with the point farthest from its own centroid, taken from
 * a cluster that has more than one member.
 */
class KMeansClusterer : public Clusterer {
public:
    explicit KMeansClusterer(const KMeansConfig& config = KMeansConfig{});

    ClusterAssignment cluster(const PointSet& points, size_t k, Rng& rng) const override;

    std::string name() const override { return "kmeans"; }

private:
    KMeansConfig config_;

    ClusterAssignment attempt(const PointSet& points, size_t k, Rng& rng) const;
};

// Number of distinct coordinates in points (exact comparison)
size_t count_distinct_points(const PointSet& points);

std::unique_ptr<Clusterer> make_default_clusterer(const KMeansConfig& config = KMeansConfig{});

} // namespace knowmap
