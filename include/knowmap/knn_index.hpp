#pragma once

/**
 * k-Nearest-Neighbour index over a 2D point set
 *
 * Backends:
 * - EXACT: uniform bucket grid with ring expansion. Exact, including ties.
 * - HNSW:  hnswlib HierarchicalNSW over L2 space, opt-in for very large sets.
 *          Approximate in recall. Candidates are re-ranked in double precision
 *          and points coinciding exactly with the query are always returned.
 *
 * Results are ordered by (distance, index), so equidistant neighbours always
 * come back lowest index first.
 */

#include "knowmap/types.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace knowmap {

enum class KnnBackend {
    EXACT,
    HNSW,
    AUTO     // HNSW at or above hnsw_threshold points, EXACT below
};

struct KnnConfig {
    KnnBackend backend = KnnBackend::EXACT;
    size_t hnsw_threshold = 50000;
    size_t hnsw_M = 16;                 // max connections per layer
    size_t hnsw_ef_construction = 200;  // construction-time candidate list
    size_t hnsw_ef_search = 64;         // query-time candidate list, never below k
};

struct Neighbor {
    size_t index;
    double distance;
};

class NeighborIndex {
public:
    explicit NeighborIndex(const PointSet& points, const KnnConfig& config = KnnConfig{});
    ~NeighborIndex();

    NeighborIndex(const NeighborIndex&) = delete;
    NeighborIndex& operator=(const NeighborIndex&) = delete;
    NeighborIndex(NeighborIndex&&) noexcept;
    NeighborIndex& operator=(NeighborIndex&&) noexcept;

    /**
     * Up to k nearest indexed points to query, sorted by (distance, index).
     * Returns fewer than k only when the index holds fewer than k points.
     */
    std::vector<Neighbor> query(const Point2D& query, size_t k) const;

    size_t size() const { return points_.size(); }
    KnnBackend backend() const { return backend_; }

private:
    struct Grid;
    struct Hnsw;

    PointSet points_;
    KnnBackend backend_;
    std::unique_ptr<Grid> grid_;
    std::unique_ptr<Hnsw> hnsw_;

    std::vector<Neighbor> query_grid(const Point2D& q, size_t k) const;
    std::vector<Neighbor> query_hnsw(const Point2D& q, size_t k) const;
};

const char* knn_backend_name(KnnBackend backend);

} // namespace knowmap
