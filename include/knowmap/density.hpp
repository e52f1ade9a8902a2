#pragma once

/**
 * Density diagnostics
 *
 * Points are binned on a grid_size x grid_size grid over the unit square.
 * The two headline numbers are the fraction of empty cells and the fraction
 * of points that sit in the densest 10% of cells; flattening should drive
 * both down.
 */

#include "knowmap/types.hpp"

#include <cstdint>
#include <string>

namespace knowmap {

struct DensityStats {
    size_t total_points = 0;
    int grid_size = constants::DEFAULT_GRID_SIZE;
    size_t total_cells = 0;
    size_t empty_cells = 0;
    double empty_fraction = 0.0;

    size_t max_density = 0;
    double median_density_nonzero = 0.0;
    double mean_density_nonzero = 0.0;
    double std_density_nonzero = 0.0;

    size_t top_decile_points = 0;      // points in the densest 10% of cells
    double top_decile_fraction = 0.0;

    double x_min = 0.0, x_max = 0.0;
    double y_min = 0.0, y_max = 0.0;

    // Coefficient of variation of non-empty cell counts (std / max(mean, 1))
    double dispersion() const;
};

DensityStats compute_density_stats(const PointSet& points, int grid_size = constants::DEFAULT_GRID_SIZE);

/**
 * Mean k-NN overlap between the original and flattened layouts.
 *
 * For up to sample_size points (chosen without replacement from seed), the k
 * nearest neighbours (self excluded) are found in both layouts; the score is
 * the mean of |overlap| / k. 1.0 = neighbourhoods untouched.
 */
double neighborhood_preservation(const PointSet& original, const PointSet& flattened,
                                 size_t k = 10, size_t sample_size = 5000, uint64_t seed = 42);

enum class CoherenceVerdict {
    LOW,        // mu may be too high
    BALANCED,
    HIGH        // density may not be sufficiently flattened
};

CoherenceVerdict classify_coherence(double overlap);

// Two-column BEFORE / AFTER table for console reports
std::string format_density_comparison(const DensityStats& before, const DensityStats& after);

} // namespace knowmap
