#pragma once

/**
 * Density Flattening for 2D knowledge-map layouts
 *
 * Redistributes a clustered, mostly-empty 2D projection toward uniform
 * coverage of the unit square while keeping local neighbourhoods intact.
 * A disjoint secondary point set (e.g. questions) is carried along with the
 * same displacement field and never influences it.
 *
 * Patched method (default):
 * 1. Seeded k-means over the primary points (cluster_count groups)
 * 2. N scrambled-Halton target slots in [margin, 1 - margin]^2
 * 3. Capacitated target-to-cluster assignment (cluster c gets |c| slots)
 * 4. Per-cluster minimum-cost one-to-one assignment (Hungarian by default)
 * 5. out = original + mu * (target - original)
 * 6. Secondary points: inverse-distance k-NN average of primary displacements
 * 7. Clamp to [0, 1]^2
 *
 * Subsample method:
 *   Farthest-point subsample of M representatives, one global assignment
 *   against M Halton targets, k-NN interpolation of the representatives'
 *   displacements onto every primary and secondary point.
 *
 * The output is a pure function of (primary, parameters) for primary points
 * and of (primary, secondary, parameters) for secondary points. It does not
 * depend on num_threads.
 */

#include "knowmap/types.hpp"
#include "knowmap/density.hpp"
#include "knowmap/knn_index.hpp"
#include "knowmap/rng.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace knowmap {

class Clusterer;
class Assigner;

enum class FlattenMethod {
    PATCHED,
    SUBSAMPLE
};

enum class AssignmentSolver {
    EXACT,      // Hungarian
    GREEDY      // greedy + pairwise swaps
};

struct FlattenParameters {
    double mu = 0.75;                   // 0 = unchanged, 1 = fully flattened
    int cluster_count = 100;            // local redistribution granularity
    int neighbor_k = 8;                 // k for secondary-point interpolation
    double margin = 0.02;               // target layout inset from the unit square edges
    uint64_t seed = 42;

    FlattenMethod method = FlattenMethod::PATCHED;
    size_t max_cluster_size = 2000;     // grow cluster_count x1.5 while exceeded; 0 = unlimited
    size_t subsample_size = 5000;       // representatives for SUBSAMPLE

    int kmeans_restarts = 3;
    int kmeans_max_iterations = 100;
    AssignmentSolver assignment = AssignmentSolver::EXACT;

    size_t num_threads = 1;             // per-cluster assignment workers; 0 = hardware concurrency
    KnnConfig knn;
};

struct FlattenMetadata {
    FlattenMethod method = FlattenMethod::PATCHED;
    double mu = 0.0;
    int neighbor_k = 0;
    double margin = 0.0;
    uint64_t seed = 0;

    size_t clusters_requested = 0;
    size_t clusters_used = 0;           // after max_cluster_size growth; 0 for SUBSAMPLE
    size_t smallest_cluster = 0;
    size_t largest_cluster = 0;
    size_t representatives = 0;         // SUBSAMPLE only

    double total_assignment_cost = 0.0;
    double mean_displacement = 0.0;     // |target - original|, before mu scaling
    double max_displacement = 0.0;
    double mean_applied_primary = 0.0;  // |output - original|
    double mean_applied_secondary = 0.0;

    DensityStats density_before;
    DensityStats density_after;
};

struct FlattenResult {
    PointSet flat_primary;
    PointSet flat_secondary;
    std::vector<Point2D> displacements;   // full (mu = 1) displacement per primary point
    FlattenMetadata metadata;
};

class Flattener {
public:
    using ProgressCallback = std::function<void(const std::string& stage, size_t current, size_t total)>;

    explicit Flattener(const FlattenParameters& params = FlattenParameters{});
    ~Flattener();

    /**
     * Flatten primary points and carry secondary points along.
     *
     * @throws InvalidParameterError  bad parameter or out-of-range coordinate (before any work)
     * @throws DegenerateInputError   fewer distinct primary points than cluster_count
     */
    FlattenResult flatten(const PointSet& primary, const PointSet& secondary) const;

    // Strategy overrides; defaults follow params (k-means, Hungarian or greedy)
    void set_clusterer(std::shared_ptr<const Clusterer> clusterer);
    void set_assigner(std::shared_ptr<const Assigner> assigner);

    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    const FlattenParameters& parameters() const { return params_; }

private:
    FlattenParameters params_;
    std::shared_ptr<const Clusterer> clusterer_;
    std::shared_ptr<const Assigner> assigner_;
    ProgressCallback progress_callback_;

    std::vector<Point2D> patched_displacements(const PointSet& primary, Rng& rng,
                                               FlattenMetadata& meta) const;

    // Returns displacements of primary points and writes those of secondary points
    std::vector<Point2D> subsample_displacements(const PointSet& primary, const PointSet& secondary,
                                                 Rng& rng, std::vector<Point2D>& secondary_disp,
                                                 FlattenMetadata& meta) const;

    void report_progress(const std::string& stage, size_t current, size_t total) const;
};

/**
 * Rejects invalid parameters with InvalidParameterError naming the field.
 * Also requires every coordinate to be finite and inside [0, 1]^2.
 */
void validate_parameters(const FlattenParameters& params, const PointSet& primary, const PointSet& secondary);

// Convenience wrapper around Flattener
FlattenResult flatten(const PointSet& primary, const PointSet& secondary, const FlattenParameters& params);

/**
 * Inverse-distance weighted average of field values at the k nearest indexed
 * points. Neighbours at distance exactly 0 share the whole weight equally.
 */
Point2D interpolate_displacement(const NeighborIndex& index, const std::vector<Point2D>& field,
                                 const Point2D& query, size_t k);

/**
 * Greedy farthest-point sampling of m indices. The first index is drawn from
 * rng; each next one maximises the distance to the selected set (ties to the
 * lower index). m >= points.size() returns every index.
 */
std::vector<size_t> farthest_point_sampling(const PointSet& points, size_t m, Rng& rng);

const char* flatten_method_name(FlattenMethod method);

} // namespace knowmap
