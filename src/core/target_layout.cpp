#include "knowmap/target_layout.hpp"
#include "knowmap/error.hpp"
#include "knowmap/logging.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <numeric>

namespace knowmap {

namespace {

// Nearest-first cluster order for one target, materialised only as deep as
// the rounds actually reach.
class PreferenceList {
public:
    void ensure_depth(const Point2D& target, const PointSet& centroids, size_t depth) {
        const size_t k = centroids.size();
        depth = std::min(depth, k);
        if (order_.size() >= depth) return;

        std::vector<uint32_t> all(k);
        std::iota(all.begin(), all.end(), 0u);
        auto closer = [&](uint32_t a, uint32_t b) {
            const double da = squared_distance(target, centroids[a]);
            const double db = squared_distance(target, centroids[b]);
            if (da != db) return da < db;
            return a < b;
        };
        std::partial_sort(all.begin(), all.begin() + static_cast<long>(depth), all.end(), closer);
        all.resize(depth);
        order_ = std::move(all);
    }

    uint32_t at(size_t round) const { return order_[round]; }
    size_t depth() const { return order_.size(); }

private:
    std::vector<uint32_t> order_;
};

} // namespace

std::vector<size_t> assign_targets_to_clusters(const PointSet& targets,
                                               const PointSet& centroids,
                                               const std::vector<size_t>& capacities) {
    const size_t n = targets.size();
    const size_t k = centroids.size();

    if (capacities.size() != k) {
        KNOWMAP_THROW(ErrorCode::INTERNAL_ERROR, "capacity count does not match centroid count");
    }
    if (std::accumulate(capacities.begin(), capacities.end(), size_t{0}) != n) {
        KNOWMAP_THROW(ErrorCode::INTERNAL_ERROR, "cluster capacities do not sum to the number of targets");
    }

    std::vector<size_t> label(n, constants::UNASSIGNED);
    if (n == 0) return label;

    std::vector<size_t> remaining = capacities;
    std::vector<PreferenceList> prefs(n);
    std::vector<size_t> unassigned(n);
    std::iota(unassigned.begin(), unassigned.end(), size_t{0});

    std::vector<std::vector<size_t>> bids(k);

    for (size_t round = 0; round < k && !unassigned.empty(); ++round) {
        for (auto& b : bids) b.clear();

        for (size_t t : unassigned) {
            if (prefs[t].depth() <= round) {
                prefs[t].ensure_depth(targets[t], centroids, std::max<size_t>(8, 2 * (round + 1)));
            }
            bids[prefs[t].at(round)].push_back(t);
        }

        for (size_t c = 0; c < k; ++c) {
            auto& bidders = bids[c];
            if (remaining[c] == 0 || bidders.empty()) continue;

            if (bidders.size() > remaining[c]) {
                // Closest first; stable keeps ascending target index on ties
                std::stable_sort(bidders.begin(), bidders.end(), [&](size_t a, size_t b) {
                    return squared_distance(targets[a], centroids[c]) < squared_distance(targets[b], centroids[c]);
                });
                bidders.resize(remaining[c]);
            }
            for (size_t t : bidders) label[t] = c;
            remaining[c] -= bidders.size();
        }

        unassigned.erase(std::remove_if(unassigned.begin(), unassigned.end(),
                                        [&](size_t t) { return label[t] != constants::UNASSIGNED; }),
                         unassigned.end());

        if ((round + 1) % 10 == 0) {
            LOG_DEBUG("Target round ", round + 1, ": ", unassigned.size(), " unassigned");
        }
    }

    if (!unassigned.empty()) {
        LOG_WARN(unassigned.size(), " targets unassigned after all rounds, using nearest-with-capacity fallback");
        for (size_t t : unassigned) {
            size_t best = constants::UNASSIGNED;
            double best_d2 = std::numeric_limits<double>::infinity();
            for (size_t c = 0; c < k; ++c) {
                if (remaining[c] == 0) continue;
                const double d2 = squared_distance(targets[t], centroids[c]);
                if (d2 < best_d2) {
                    best_d2 = d2;
                    best = c;
                }
            }
            if (best == constants::UNASSIGNED) {
                KNOWMAP_THROW(ErrorCode::INTERNAL_ERROR, "no cluster capacity left for target");
            }
            label[t] = best;
            --remaining[best];
        }
    }

    return label;
}

} // namespace knowmap
