#include "knowmap/clustering.hpp"
#include "knowmap/error.hpp"
#include "knowmap/logging.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <limits>

namespace knowmap {

namespace {

using PointMatrix = Eigen::Matrix<double, Eigen::Dynamic, 2, Eigen::RowMajor>;

PointMatrix to_matrix(const PointSet& points) {
    PointMatrix m(static_cast<Eigen::Index>(points.size()), 2);
    for (size_t i = 0; i < points.size(); ++i) {
        m(static_cast<Eigen::Index>(i), 0) = points[i].x;
        m(static_cast<Eigen::Index>(i), 1) = points[i].y;
    }
    return m;
}

// Returns (index, squared distance) of the nearest centroid; ties -> lower index
std::pair<size_t, double> nearest_centroid(const PointMatrix& X, Eigen::Index i, const PointMatrix& C) {
    size_t best = 0;
    double best_d2 = std::numeric_limits<double>::infinity();
    for (Eigen::Index c = 0; c < C.rows(); ++c) {
        double d2 = (X.row(i) - C.row(c)).squaredNorm();
        if (d2 < best_d2) {
            best_d2 = d2;
            best = static_cast<size_t>(c);
        }
    }
    return {best, best_d2};
}

// k-means++: first center uniform, then D^2-weighted
PointMatrix seed_centroids(const PointMatrix& X, size_t k, Rng& rng) {
    const Eigen::Index n = X.rows();
    PointMatrix C(static_cast<Eigen::Index>(k), 2);

    C.row(0) = X.row(static_cast<Eigen::Index>(rng.index(static_cast<size_t>(n))));

    Eigen::VectorXd d2 = (X.rowwise() - C.row(0)).rowwise().squaredNorm();

    for (size_t c = 1; c < k; ++c) {
        const double total = d2.sum();
        Eigen::Index chosen = -1;

        if (total > 0.0) {
            const double u = rng.uniform() * total;
            double acc = 0.0;
            for (Eigen::Index i = 0; i < n; ++i) {
                if (d2[i] <= 0.0) continue;
                acc += d2[i];
                chosen = i;
                if (acc > u) break;
            }
        }
        if (chosen < 0) {
            // Only reachable when every point coincides with a chosen center
            KNOWMAP_THROW(ErrorCode::INTERNAL_ERROR, "k-means++ seeding ran out of distinct points");
        }

        C.row(static_cast<Eigen::Index>(c)) = X.row(chosen);
        d2 = d2.cwiseMin((X.rowwise() - X.row(chosen)).rowwise().squaredNorm());
    }
    return C;
}

void recompute_centroids(const PointMatrix& X, const std::vector<size_t>& labels,
                         PointMatrix& C, std::vector<size_t>& sizes) {
    PointMatrix sums = PointMatrix::Zero(C.rows(), 2);
    std::fill(sizes.begin(), sizes.end(), 0);

    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        sums.row(static_cast<Eigen::Index>(labels[i])) += X.row(i);
        ++sizes[labels[i]];
    }
    for (Eigen::Index c = 0; c < C.rows(); ++c) {
        if (sizes[c] > 0) {
            C.row(c) = sums.row(c) / static_cast<double>(sizes[c]);
        }
    }
}

// Move the farthest-from-centroid point of a multi-member cluster into each
// empty cluster. Each move fills one cluster without emptying another.
void repair_empty_clusters(const PointMatrix& X, std::vector<size_t>& labels,
                           PointMatrix& C, std::vector<size_t>& sizes) {
    for (size_t empty = 0; empty < sizes.size(); ++empty) {
        if (sizes[empty] > 0) continue;

        Eigen::Index donor = -1;
        double donor_d2 = 0.0;
        for (Eigen::Index i = 0; i < X.rows(); ++i) {
            if (sizes[labels[i]] < 2) continue;
            double d2 = (X.row(i) - C.row(static_cast<Eigen::Index>(labels[i]))).squaredNorm();
            if (d2 > donor_d2) {
                donor_d2 = d2;
                donor = i;
            }
        }
        if (donor < 0) {
            KNOWMAP_THROW(ErrorCode::INTERNAL_ERROR, "no donor point available for empty cluster");
        }

        labels[donor] = empty;
        C.row(static_cast<Eigen::Index>(empty)) = X.row(donor);
        recompute_centroids(X, labels, C, sizes);
    }
}

} // namespace

std::vector<size_t> ClusterAssignment::members(size_t c) const {
    std::vector<size_t> out;
    out.reserve(c < sizes.size() ? sizes[c] : 0);
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i] == c) out.push_back(i);
    }
    return out;
}

size_t count_distinct_points(const PointSet& points) {
    PointSet sorted = points;
    std::sort(sorted.begin(), sorted.end());
    return static_cast<size_t>(std::unique(sorted.begin(), sorted.end()) - sorted.begin());
}

KMeansClusterer::KMeansClusterer(const KMeansConfig& config) : config_(config) {
    if (config_.restarts < 1) config_.restarts = 1;
    if (config_.max_iterations < 1) config_.max_iterations = 1;
}

ClusterAssignment KMeansClusterer::cluster(const PointSet& points, size_t k, Rng& rng) const {
    KNOWMAP_CHECK_PARAM(k > 0 && k <= points.size(), "cluster_count",
                        "0 < cluster_count <= number of primary points");

    const size_t distinct = count_distinct_points(points);
    if (distinct < k) {
        throw DegenerateInputError(
            "cannot form " + std::to_string(k) + " non-empty clusters from " +
            std::to_string(distinct) + " distinct primary points",
            distinct, k, __func__);
    }

    // One draw from the caller's stream; restarts get derived streams
    const Rng base(rng.next());

    ClusterAssignment best;
    bool have_best = false;
    for (int r = 0; r < config_.restarts; ++r) {
        Rng stream = base.derive(static_cast<uint64_t>(r));
        ClusterAssignment result = attempt(points, k, stream);
        LOG_DEBUG("k-means restart ", r, ": inertia=", result.inertia, " iterations=", result.iterations);
        if (!have_best || result.inertia < best.inertia) {
            best = std::move(result);
            have_best = true;
        }
    }
    return best;
}

ClusterAssignment KMeansClusterer::attempt(const PointSet& points, size_t k, Rng& rng) const {
    const PointMatrix X = to_matrix(points);
    const Eigen::Index n = X.rows();

    PointMatrix C = seed_centroids(X, k, rng);
    std::vector<size_t> labels(static_cast<size_t>(n), constants::UNASSIGNED);
    std::vector<size_t> sizes(k, 0);

    int iter = 0;
    for (; iter < config_.max_iterations; ++iter) {
        bool changed = false;
        for (Eigen::Index i = 0; i < n; ++i) {
            size_t c = nearest_centroid(X, i, C).first;
            if (labels[i] != c) {
                labels[i] = c;
                changed = true;
            }
        }

        PointMatrix previous = C;
        recompute_centroids(X, labels, C, sizes);
        repair_empty_clusters(X, labels, C, sizes);

        const double shift = (C - previous).rowwise().norm().maxCoeff();
        if (!changed || shift <= config_.tolerance) {
            ++iter;
            break;
        }
    }

    ClusterAssignment out;
    out.labels = std::move(labels);
    out.sizes = std::move(sizes);
    out.iterations = iter;
    out.centroids.reserve(k);
    for (Eigen::Index c = 0; c < C.rows(); ++c) {
        out.centroids.emplace_back(C(c, 0), C(c, 1));
    }
    for (Eigen::Index i = 0; i < n; ++i) {
        out.inertia += (X.row(i) - C.row(static_cast<Eigen::Index>(out.labels[i]))).squaredNorm();
    }
    return out;
}

std::unique_ptr<Clusterer> make_default_clusterer(const KMeansConfig& config) {
    return std::make_unique<KMeansClusterer>(config);
}

} // namespace knowmap
