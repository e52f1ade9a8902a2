#include "knowmap/flatten.hpp"
#include "knowmap/assignment.hpp"
#include "knowmap/clustering.hpp"
#include "knowmap/error.hpp"
#include "knowmap/halton.hpp"
#include "knowmap/logging.hpp"
#include "knowmap/target_layout.hpp"
#include "knowmap/thread_pool.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

namespace knowmap {

namespace {

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

void validate_points(const PointSet& points, const char* field) {
    for (size_t i = 0; i < points.size(); ++i) {
        const Point2D& p = points[i];
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !p.in_unit_square()) {
            throw InvalidParameterError(field, "every coordinate finite and within [0, 1]",
                                        "point " + std::to_string(i));
        }
    }
}

double mean_offset(const PointSet& a, const PointSet& b) {
    if (a.empty()) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) sum += distance(a[i], b[i]);
    return sum / static_cast<double>(a.size());
}

} // namespace

// =============================================================================
// Validation
// =============================================================================

void validate_parameters(const FlattenParameters& params, const PointSet& primary, const PointSet& secondary) {
    KNOWMAP_CHECK_PARAM(std::isfinite(params.mu) && params.mu >= 0.0 && params.mu <= 1.0,
                        "mu", "0 <= mu <= 1");
    KNOWMAP_CHECK_PARAM(params.cluster_count > 0 &&
                        static_cast<size_t>(params.cluster_count) <= primary.size(),
                        "cluster_count", "0 < cluster_count <= number of primary points");
    KNOWMAP_CHECK_PARAM(params.neighbor_k > 0, "neighbor_k", "neighbor_k > 0");
    KNOWMAP_CHECK_PARAM(std::isfinite(params.margin) && params.margin >= 0.0 && params.margin < 0.5,
                        "margin", "0 <= margin < 0.5");
    KNOWMAP_CHECK_PARAM(params.kmeans_restarts > 0, "kmeans_restarts", "kmeans_restarts > 0");
    KNOWMAP_CHECK_PARAM(params.kmeans_max_iterations > 0, "kmeans_max_iterations",
                        "kmeans_max_iterations > 0");
    if (params.method == FlattenMethod::SUBSAMPLE) {
        KNOWMAP_CHECK_PARAM(params.subsample_size > 0, "subsample_size", "subsample_size > 0");
    }

    validate_points(primary, "primary_points");
    validate_points(secondary, "secondary_points");
}

// =============================================================================
// Shared helpers
// =============================================================================

Point2D interpolate_displacement(const NeighborIndex& index, const std::vector<Point2D>& field,
                                 const Point2D& query, size_t k) {
    const auto neighbours = index.query(query, k);
    if (neighbours.empty()) return {};

    // Coincident neighbours sort first and take all the weight
    if (neighbours.front().distance == 0.0) {
        Point2D sum;
        size_t count = 0;
        for (const auto& nb : neighbours) {
            if (nb.distance != 0.0) break;
            sum += field[nb.index];
            ++count;
        }
        return sum * (1.0 / static_cast<double>(count));
    }

    Point2D sum;
    double weight_total = 0.0;
    for (const auto& nb : neighbours) {
        const double w = 1.0 / nb.distance;
        sum += field[nb.index] * w;
        weight_total += w;
    }
    return sum * (1.0 / weight_total);
}

std::vector<size_t> farthest_point_sampling(const PointSet& points, size_t m, Rng& rng) {
    const size_t n = points.size();
    std::vector<size_t> selected;
    if (m >= n) {
        selected.resize(n);
        for (size_t i = 0; i < n; ++i) selected[i] = i;
        return selected;
    }
    if (m == 0) return selected;

    selected.reserve(m);
    std::vector<double> min_d2(n, std::numeric_limits<double>::infinity());
    std::vector<char> taken(n, 0);

    size_t next = rng.index(n);
    for (size_t i = 0; i < m; ++i) {
        selected.push_back(next);
        taken[next] = 1;

        const Point2D& p = points[next];
        size_t best = constants::UNASSIGNED;
        double best_d2 = -1.0;
        for (size_t j = 0; j < n; ++j) {
            min_d2[j] = std::min(min_d2[j], squared_distance(points[j], p));
            if (!taken[j] && min_d2[j] > best_d2) {
                best_d2 = min_d2[j];
                best = j;
            }
        }
        next = best;

        if ((i + 1) % 1000 == 0 || i + 1 == m) {
            LOG_DEBUG("Farthest-point sampling: ", i + 1, "/", m);
        }
    }
    return selected;
}

const char* flatten_method_name(FlattenMethod method) {
    switch (method) {
        case FlattenMethod::PATCHED:   return "patched";
        case FlattenMethod::SUBSAMPLE: return "subsample";
    }
    return "unknown";
}

// =============================================================================
// Flattener
// =============================================================================

Flattener::Flattener(const FlattenParameters& params) : params_(params) {
    KMeansConfig kmeans;
    kmeans.restarts = params_.kmeans_restarts;
    kmeans.max_iterations = params_.kmeans_max_iterations;
    clusterer_ = std::make_shared<KMeansClusterer>(kmeans);

    if (params_.assignment == AssignmentSolver::GREEDY) {
        assigner_ = std::make_shared<GreedyAssigner>();
    } else {
        assigner_ = std::make_shared<HungarianAssigner>();
    }
}

Flattener::~Flattener() = default;

void Flattener::set_clusterer(std::shared_ptr<const Clusterer> clusterer) {
    if (!clusterer) throw InvalidParameterError("clusterer", "non-null strategy", __func__);
    clusterer_ = std::move(clusterer);
}

void Flattener::set_assigner(std::shared_ptr<const Assigner> assigner) {
    if (!assigner) throw InvalidParameterError("assigner", "non-null strategy", __func__);
    assigner_ = std::move(assigner);
}

void Flattener::report_progress(const std::string& stage, size_t current, size_t total) const {
    if (progress_callback_) {
        progress_callback_(stage, current, total);
    }
}

FlattenResult Flattener::flatten(const PointSet& primary, const PointSet& secondary) const {
    validate_parameters(params_, primary, secondary);

    const auto t_start = Clock::now();
    const double mu = params_.mu;

    LOG_INFO("Flattening ", primary.size(), " primary and ", secondary.size(), " secondary points (method=",
             flatten_method_name(params_.method), ", mu=", mu, ", clusters=", params_.cluster_count,
             ", k=", params_.neighbor_k, ", margin=", params_.margin, ", seed=", params_.seed, ")");

    FlattenResult result;
    FlattenMetadata& meta = result.metadata;
    meta.method = params_.method;
    meta.mu = mu;
    meta.neighbor_k = params_.neighbor_k;
    meta.margin = params_.margin;
    meta.seed = params_.seed;
    meta.clusters_requested = static_cast<size_t>(params_.cluster_count);
    meta.density_before = compute_density_stats(primary);

    Rng rng(params_.seed);
    std::vector<Point2D> secondary_disp;

    if (params_.method == FlattenMethod::SUBSAMPLE) {
        result.displacements = subsample_displacements(primary, secondary, rng, secondary_disp, meta);
    } else {
        result.displacements = patched_displacements(primary, rng, meta);

        report_progress("secondary interpolation", 0, secondary.size());
        const auto t0 = Clock::now();
        const NeighborIndex index(primary, params_.knn);
        secondary_disp.resize(secondary.size());
        for (size_t i = 0; i < secondary.size(); ++i) {
            secondary_disp[i] = interpolate_displacement(index, result.displacements, secondary[i],
                                                         static_cast<size_t>(params_.neighbor_k));
        }
        report_progress("secondary interpolation", secondary.size(), secondary.size());
        LOG_INFO("Interpolated ", secondary.size(), " secondary displacements (", knn_backend_name(index.backend()),
                 " k-NN) in ", seconds_since(t0), "s");
    }

    double disp_sum = 0.0;
    for (const auto& d : result.displacements) {
        const double len = d.norm();
        disp_sum += len;
        meta.max_displacement = std::max(meta.max_displacement, len);
    }
    meta.mean_displacement = primary.empty() ? 0.0 : disp_sum / static_cast<double>(primary.size());

    result.flat_primary.resize(primary.size());
    for (size_t i = 0; i < primary.size(); ++i) {
        result.flat_primary[i] = clamp_unit(primary[i] + result.displacements[i] * mu);
    }
    result.flat_secondary.resize(secondary.size());
    for (size_t i = 0; i < secondary.size(); ++i) {
        result.flat_secondary[i] = clamp_unit(secondary[i] + secondary_disp[i] * mu);
    }

    meta.mean_applied_primary = mean_offset(primary, result.flat_primary);
    meta.mean_applied_secondary = mean_offset(secondary, result.flat_secondary);
    meta.density_after = compute_density_stats(result.flat_primary);

    LOG_INFO("Flattening done in ", seconds_since(t_start), "s: empty cells ",
             100.0 * meta.density_before.empty_fraction, "% -> ", 100.0 * meta.density_after.empty_fraction,
             "%, mean displacement ", meta.mean_applied_primary);
    return result;
}

std::vector<Point2D> Flattener::patched_displacements(const PointSet& primary, Rng& rng,
                                                      FlattenMetadata& meta) const {
    const size_t n = primary.size();

    // ---- Cluster, growing K while any cluster is too large for the solver ----
    auto t0 = Clock::now();
    const size_t distinct = count_distinct_points(primary);
    size_t k = static_cast<size_t>(params_.cluster_count);
    ClusterAssignment clusters;
    while (true) {
        report_progress("clustering", 0, k);
        clusters = clusterer_->cluster(primary, k, rng);

        const size_t largest = *std::max_element(clusters.sizes.begin(), clusters.sizes.end());
        if (params_.max_cluster_size == 0 || largest <= params_.max_cluster_size || k >= distinct) {
            break;
        }
        const size_t grown = std::min(distinct, std::max(k + 1, k * 3 / 2));
        LOG_INFO("K=", k, ": largest cluster ", largest, " > ", params_.max_cluster_size, ", increasing to K=", grown);
        k = grown;
    }
    meta.clusters_used = k;
    meta.smallest_cluster = *std::min_element(clusters.sizes.begin(), clusters.sizes.end());
    meta.largest_cluster = *std::max_element(clusters.sizes.begin(), clusters.sizes.end());
    LOG_INFO("Clustered into K=", k, " (sizes ", meta.smallest_cluster, "..", meta.largest_cluster,
             ") in ", seconds_since(t0), "s");

    // ---- Uniform targets, capacitated per cluster ----
    t0 = Clock::now();
    const PointSet targets = scrambled_halton_points(n, params_.margin, rng);
    const std::vector<size_t> target_labels = assign_targets_to_clusters(targets, clusters.centroids, clusters.sizes);
    LOG_INFO("Placed ", n, " Halton targets into ", k, " cluster regions in ", seconds_since(t0), "s");

    std::vector<std::vector<size_t>> source_members(k), target_members(k);
    for (size_t i = 0; i < n; ++i) {
        source_members[clusters.labels[i]].push_back(i);
        target_members[target_labels[i]].push_back(i);
    }

    // ---- Per-cluster assignment; slots are merged in cluster order ----
    t0 = Clock::now();
    std::vector<Assignment> solved(k);
    auto solve_cluster = [&](size_t c) {
        PointSet sources, slots;
        sources.reserve(source_members[c].size());
        slots.reserve(target_members[c].size());
        for (size_t i : source_members[c]) sources.push_back(primary[i]);
        for (size_t t : target_members[c]) slots.push_back(targets[t]);
        solved[c] = assigner_->assign(sources, slots);
    };

    if (params_.num_threads == 1 || k == 1) {
        for (size_t c = 0; c < k; ++c) {
            solve_cluster(c);
            report_progress("assignment", c + 1, k);
        }
    } else {
        ThreadPool pool(params_.num_threads);
        pool.parallel_for(0, k, solve_cluster);
        report_progress("assignment", k, k);
    }

    std::vector<Point2D> displacements(n);
    meta.total_assignment_cost = 0.0;
    for (size_t c = 0; c < k; ++c) {
        const auto& members = source_members[c];
        for (size_t i = 0; i < members.size(); ++i) {
            const size_t slot = target_members[c][solved[c].target_of[i]];
            displacements[members[i]] = targets[slot] - primary[members[i]];
        }
        meta.total_assignment_cost += solved[c].total_cost;
    }
    LOG_INFO(assigner_->name(), " assignment over ", k, " clusters in ", seconds_since(t0),
             "s, total cost ", meta.total_assignment_cost);

    return displacements;
}

std::vector<Point2D> Flattener::subsample_displacements(const PointSet& primary, const PointSet& secondary,
                                                        Rng& rng, std::vector<Point2D>& secondary_disp,
                                                        FlattenMetadata& meta) const {
    auto t0 = Clock::now();
    const std::vector<size_t> reps_idx = farthest_point_sampling(primary, params_.subsample_size, rng);
    const size_t m = reps_idx.size();
    meta.representatives = m;

    PointSet reps;
    reps.reserve(m);
    for (size_t i : reps_idx) reps.push_back(primary[i]);
    LOG_INFO("Selected ", m, " representatives in ", seconds_since(t0), "s");

    t0 = Clock::now();
    const PointSet targets = halton_points(m, params_.margin);
    report_progress("assignment", 0, 1);
    const Assignment solved = assigner_->assign(reps, targets);
    report_progress("assignment", 1, 1);
    meta.total_assignment_cost = solved.total_cost;
    LOG_INFO(assigner_->name(), " assignment on ", m, "x", m, " in ", seconds_since(t0),
             "s, total cost ", solved.total_cost);

    std::vector<Point2D> rep_disp(m);
    for (size_t j = 0; j < m; ++j) {
        rep_disp[j] = targets[solved.target_of[j]] - reps[j];
    }

    t0 = Clock::now();
    const NeighborIndex index(reps, params_.knn);
    const size_t k = static_cast<size_t>(params_.neighbor_k);

    std::vector<Point2D> primary_disp(primary.size());
    for (size_t i = 0; i < primary.size(); ++i) {
        primary_disp[i] = interpolate_displacement(index, rep_disp, primary[i], k);
    }
    secondary_disp.resize(secondary.size());
    for (size_t i = 0; i < secondary.size(); ++i) {
        secondary_disp[i] = interpolate_displacement(index, rep_disp, secondary[i], k);
    }
    report_progress("interpolation", primary.size() + secondary.size(), primary.size() + secondary.size());
    LOG_INFO("Interpolated displacements to ", primary.size() + secondary.size(), " points in ",
             seconds_since(t0), "s");

    return primary_disp;
}

FlattenResult flatten(const PointSet& primary, const PointSet& secondary, const FlattenParameters& params) {
    return Flattener(params).flatten(primary, secondary);
}

} // namespace knowmap
