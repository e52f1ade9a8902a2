#pragma once

#include "knowmap/types.hpp"

#include <vector>

namespace knowmap {

/**
 * Capacitated assignment of target slots to clusters.
 *
 * Cluster c receives exactly capacities[c] targets, so its target region is
 * proportional to its population. Assignment runs in rounds: in round r
 * every unassigned target bids for its r-th nearest centroid; a cluster with
 * enough room accepts all bidders, otherwise it keeps the closest ones (ties
 * to the lower target index) until full. Targets still unassigned after all
 * rounds go to the nearest cluster with room left.
 *
 * Requires sum(capacities) == targets.size() and capacities.size() == centroids.size().
 * Returns the cluster index of each target.
 */
std::vector<size_t> assign_targets_to_clusters(const PointSet& targets,
                                               const PointSet& centroids,
                                               const std::vector<size_t>& capacities);

} // namespace knowmap
