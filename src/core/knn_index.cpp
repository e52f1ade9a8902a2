#include "knowmap/knn_index.hpp"
#include "knowmap/logging.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wtype-limits"
#include <hnswlib/hnswlib.h>
#pragma GCC diagnostic pop

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace knowmap {

namespace {

bool neighbor_less(const Neighbor& a, const Neighbor& b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    return a.index < b.index;
}

} // namespace

// =============================================================================
// Bucket grid (exact backend)
// =============================================================================

struct NeighborIndex::Grid {
    double min_x = 0.0;
    double min_y = 0.0;
    double cell = 1.0;
    size_t cols = 1;
    size_t rows = 1;
    std::vector<size_t> cell_start;   // CSR offsets, cols * rows + 1
    std::vector<size_t> cell_points;  // point indices, ascending within a cell

    size_t col_of(double x) const {
        double c = std::floor((x - min_x) / cell);
        if (!(c > 0.0)) return 0;
        return std::min(static_cast<size_t>(c), cols - 1);
    }

    size_t row_of(double y) const {
        double r = std::floor((y - min_y) / cell);
        if (!(r > 0.0)) return 0;
        return std::min(static_cast<size_t>(r), rows - 1);
    }

    void build(const PointSet& points) {
        const size_t n = points.size();
        double max_x = points[0].x, max_y = points[0].y;
        min_x = points[0].x;
        min_y = points[0].y;
        for (const auto& p : points) {
            min_x = std::min(min_x, p.x);
            min_y = std::min(min_y, p.y);
            max_x = std::max(max_x, p.x);
            max_y = std::max(max_y, p.y);
        }

        // About two points per cell on average
        const size_t side = std::max<size_t>(1, static_cast<size_t>(std::ceil(std::sqrt(n / 2.0))));
        const double extent = std::max(max_x - min_x, max_y - min_y);
        cell = extent > 0.0 ? extent / static_cast<double>(side) : 1.0;
        cols = std::min(side, static_cast<size_t>((max_x - min_x) / cell) + 1);
        rows = std::min(side, static_cast<size_t>((max_y - min_y) / cell) + 1);

        std::vector<size_t> counts(cols * rows + 1, 0);
        std::vector<size_t> slot(n);
        for (size_t i = 0; i < n; ++i) {
            slot[i] = row_of(points[i].y) * cols + col_of(points[i].x);
            ++counts[slot[i] + 1];
        }
        for (size_t c = 1; c < counts.size(); ++c) {
            counts[c] += counts[c - 1];
        }
        cell_start = counts;
        cell_points.assign(n, 0);
        for (size_t i = 0; i < n; ++i) {
            cell_points[counts[slot[i]]++] = i;
        }
    }
};

// =============================================================================
// HNSW (approximate backend)
// =============================================================================

struct NeighborIndex::Hnsw {
    std::unique_ptr<hnswlib::L2Space> space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> index;
    size_t ef_search = 0;
    // Exact coordinates to indices; float rounding can tie distinct points inside hnswlib
    std::map<std::pair<double, double>, std::vector<size_t>> exact;
};

NeighborIndex::NeighborIndex(const PointSet& points, const KnnConfig& config)
    : points_(points), backend_(config.backend) {
    if (backend_ == KnnBackend::AUTO) {
        backend_ = points_.size() >= config.hnsw_threshold ? KnnBackend::HNSW : KnnBackend::EXACT;
    }
    if (points_.empty()) {
        backend_ = KnnBackend::EXACT;
        return;
    }

    if (backend_ == KnnBackend::EXACT) {
        grid_ = std::make_unique<Grid>();
        grid_->build(points_);
        return;
    }

    LOG_INFO("Building HNSW index for ", points_.size(), " points (M=", config.hnsw_M,
             ", ef_construction=", config.hnsw_ef_construction, ")");

    hnsw_ = std::make_unique<Hnsw>();
    hnsw_->space = std::make_unique<hnswlib::L2Space>(2);
    hnsw_->index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        hnsw_->space.get(), points_.size(), config.hnsw_M, config.hnsw_ef_construction);

    for (size_t i = 0; i < points_.size(); ++i) {
        const float v[2] = {static_cast<float>(points_[i].x), static_cast<float>(points_[i].y)};
        hnsw_->index->addPoint(v, static_cast<hnswlib::labeltype>(i));
        hnsw_->exact[{points_[i].x, points_[i].y}].push_back(i);
    }
    hnsw_->ef_search = config.hnsw_ef_search;
    hnsw_->index->setEf(config.hnsw_ef_search);
}

NeighborIndex::~NeighborIndex() = default;
NeighborIndex::NeighborIndex(NeighborIndex&&) noexcept = default;
NeighborIndex& NeighborIndex::operator=(NeighborIndex&&) noexcept = default;

std::vector<Neighbor> NeighborIndex::query(const Point2D& q, size_t k) const {
    if (k == 0 || points_.empty()) return {};
    k = std::min(k, points_.size());
    return backend_ == KnnBackend::HNSW ? query_hnsw(q, k) : query_grid(q, k);
}

std::vector<Neighbor> NeighborIndex::query_grid(const Point2D& q, size_t k) const {
    const Grid& g = *grid_;
    const long cx = static_cast<long>(g.col_of(q.x));
    const long cy = static_cast<long>(g.row_of(q.y));
    const long max_ring = std::max({cx, static_cast<long>(g.cols) - 1 - cx,
                                    cy, static_cast<long>(g.rows) - 1 - cy});

    std::vector<Neighbor> candidates;

    auto visit = [&](long x, long y) {
        if (x < 0 || y < 0 || x >= static_cast<long>(g.cols) || y >= static_cast<long>(g.rows)) return;
        const size_t c = static_cast<size_t>(y) * g.cols + static_cast<size_t>(x);
        for (size_t s = g.cell_start[c]; s < g.cell_start[c + 1]; ++s) {
            const size_t idx = g.cell_points[s];
            candidates.push_back({idx, distance(q, points_[idx])});
        }
    };

    for (long r = 0; r <= max_ring; ++r) {
        if (r == 0) {
            visit(cx, cy);
        } else {
            for (long x = cx - r; x <= cx + r; ++x) {
                visit(x, cy - r);
                visit(x, cy + r);
            }
            for (long y = cy - r + 1; y <= cy + r - 1; ++y) {
                visit(cx - r, y);
                visit(cx + r, y);
            }
        }

        if (candidates.size() >= k) {
            std::nth_element(candidates.begin(), candidates.begin() + static_cast<long>(k - 1),
                             candidates.end(), neighbor_less);
            const double kth = candidates[k - 1].distance;
            // Every cell in ring r+1 is at least r * cell away from q
            if (static_cast<double>(r) * g.cell > kth) break;
        }
    }

    std::sort(candidates.begin(), candidates.end(), neighbor_less);
    candidates.resize(std::min(k, candidates.size()));
    return candidates;
}

std::vector<Neighbor> NeighborIndex::query_hnsw(const Point2D& q, size_t k) const {
    // Over-fetch so float-rounded near ties are re-ranked in double precision
    const size_t fetch = std::min(points_.size(), std::max(2 * k, hnsw_->ef_search));
    const float v[2] = {static_cast<float>(q.x), static_cast<float>(q.y)};
    auto result = hnsw_->index->searchKnn(v, fetch);

    std::vector<Neighbor> out;
    out.reserve(result.size() + 1);
    while (!result.empty()) {
        const size_t idx = static_cast<size_t>(result.top().second);
        result.pop();
        out.push_back({idx, distance(q, points_[idx])});
    }

    auto hit = hnsw_->exact.find({q.x, q.y});
    if (hit != hnsw_->exact.end()) {
        for (size_t idx : hit->second) out.push_back({idx, 0.0});
    }

    std::sort(out.begin(), out.end(), neighbor_less);
    out.erase(std::unique(out.begin(), out.end(), [](const Neighbor& a, const Neighbor& b) {
        return a.index == b.index;
    }), out.end());
    out.resize(std::min(k, out.size()));
    return out;
}

const char* knn_backend_name(KnnBackend backend) {
    switch (backend) {
        case KnnBackend::EXACT: return "exact";
        case KnnBackend::HNSW:  return "hnsw";
        case KnnBackend::AUTO:  return "auto";
    }
    return "unknown";
}

} // namespace knowmap
