#include "knowmap/density.hpp"
#include "knowmap/error.hpp"
#include "knowmap/knn_index.hpp"
#include "knowmap/rng.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <unordered_set>

namespace knowmap {

double DensityStats::dispersion() const {
    return std_density_nonzero / std::max(mean_density_nonzero, 1.0);
}

DensityStats compute_density_stats(const PointSet& points, int grid_size) {
    KNOWMAP_CHECK_PARAM(grid_size > 0, "grid_size", "grid_size > 0");

    DensityStats s;
    s.total_points = points.size();
    s.grid_size = grid_size;
    s.total_cells = static_cast<size_t>(grid_size) * static_cast<size_t>(grid_size);

    std::vector<size_t> grid(s.total_cells, 0);
    for (const auto& p : points) {
        // Clip to [0, 1) before binning
        const double x = std::clamp(p.x, 0.0, 1.0 - 1e-10);
        const double y = std::clamp(p.y, 0.0, 1.0 - 1e-10);
        const int cx = std::clamp(static_cast<int>(x * grid_size), 0, grid_size - 1);
        const int cy = std::clamp(static_cast<int>(y * grid_size), 0, grid_size - 1);
        ++grid[static_cast<size_t>(cx) * grid_size + cy];
    }

    std::vector<size_t> nonzero;
    for (size_t c : grid) {
        if (c == 0) ++s.empty_cells;
        else nonzero.push_back(c);
    }
    s.empty_fraction = static_cast<double>(s.empty_cells) / static_cast<double>(s.total_cells);
    s.max_density = grid.empty() ? 0 : *std::max_element(grid.begin(), grid.end());

    if (!nonzero.empty()) {
        std::sort(nonzero.begin(), nonzero.end());
        const size_t m = nonzero.size();
        s.median_density_nonzero = (m % 2 == 1)
            ? static_cast<double>(nonzero[m / 2])
            : 0.5 * static_cast<double>(nonzero[m / 2 - 1] + nonzero[m / 2]);

        const double sum = static_cast<double>(std::accumulate(nonzero.begin(), nonzero.end(), size_t{0}));
        s.mean_density_nonzero = sum / static_cast<double>(m);
        double var = 0.0;
        for (size_t c : nonzero) {
            const double d = static_cast<double>(c) - s.mean_density_nonzero;
            var += d * d;
        }
        s.std_density_nonzero = std::sqrt(var / static_cast<double>(m));
    }

    std::vector<size_t> sorted = grid;
    std::sort(sorted.begin(), sorted.end(), std::greater<size_t>());
    const size_t top_cells = std::max<size_t>(1, static_cast<size_t>(s.total_cells * constants::TOP_FRACTION));
    s.top_decile_points = std::accumulate(sorted.begin(), sorted.begin() + static_cast<long>(top_cells), size_t{0});
    s.top_decile_fraction = points.empty() ? 0.0
        : static_cast<double>(s.top_decile_points) / static_cast<double>(points.size());

    if (!points.empty()) {
        s.x_min = s.x_max = points[0].x;
        s.y_min = s.y_max = points[0].y;
        for (const auto& p : points) {
            s.x_min = std::min(s.x_min, p.x);
            s.x_max = std::max(s.x_max, p.x);
            s.y_min = std::min(s.y_min, p.y);
            s.y_max = std::max(s.y_max, p.y);
        }
    }
    return s;
}

double neighborhood_preservation(const PointSet& original, const PointSet& flattened,
                                 size_t k, size_t sample_size, uint64_t seed) {
    KNOWMAP_CHECK_PARAM(original.size() == flattened.size(), "flattened",
                        "same number of points as original");
    KNOWMAP_CHECK_PARAM(k > 0, "k", "k > 0");

    const size_t n = original.size();
    if (n < 2) return 1.0;
    k = std::min(k, n - 1);

    // Partial Fisher-Yates: first `take` entries are a sample without replacement
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    Rng rng(seed);
    const size_t take = std::min(sample_size, n);
    for (size_t i = 0; i < take; ++i) {
        std::swap(order[i], order[i + rng.index(n - i)]);
    }

    const NeighborIndex orig_index(original);
    const NeighborIndex flat_index(flattened);

    auto neighbours_excluding_self = [k](const NeighborIndex& index, const Point2D& p, size_t self) {
        std::vector<size_t> out;
        for (const auto& nb : index.query(p, k + 1)) {
            if (nb.index != self && out.size() < k) out.push_back(nb.index);
        }
        return out;
    };

    double total = 0.0;
    for (size_t s = 0; s < take; ++s) {
        const size_t idx = order[s];
        const auto a = neighbours_excluding_self(orig_index, original[idx], idx);
        const auto b = neighbours_excluding_self(flat_index, flattened[idx], idx);
        const std::unordered_set<size_t> set_a(a.begin(), a.end());
        size_t overlap = 0;
        for (size_t j : b) {
            if (set_a.count(j)) ++overlap;
        }
        total += static_cast<double>(overlap) / static_cast<double>(k);
    }
    return total / static_cast<double>(take);
}

CoherenceVerdict classify_coherence(double overlap) {
    if (overlap < 0.3) return CoherenceVerdict::LOW;
    if (overlap > 0.8) return CoherenceVerdict::HIGH;
    return CoherenceVerdict::BALANCED;
}

std::string format_density_comparison(const DensityStats& before, const DensityStats& after) {
    std::ostringstream os;
    const std::string rule(70, '=');

    auto pct = [](double f) {
        std::ostringstream s;
        s << std::fixed << std::setprecision(1) << 100.0 * f << "%";
        return s.str();
    };
    auto num = [](double v, int precision) {
        std::ostringstream s;
        s << std::fixed << std::setprecision(precision) << v;
        return s.str();
    };
    auto range = [](double lo, double hi) {
        std::ostringstream s;
        s << std::fixed << std::setprecision(3) << "[" << lo << ", " << hi << "]";
        return s.str();
    };
    auto row = [&os](const std::string& label, const std::string& b, const std::string& a) {
        os << "  " << std::left << std::setw(35) << label
           << std::right << std::setw(14) << b << "  " << std::setw(14) << a << "\n";
    };

    os << rule << "\n"
       << "DENSITY COMPARISON (" << before.grid_size << "x" << before.grid_size << " grid)\n"
       << rule << "\n";
    row("Metric", "BEFORE", "AFTER");
    os << "  " << std::string(66, '-') << "\n";
    row("Empty cells", pct(before.empty_fraction), pct(after.empty_fraction));
    row("Points in top 10% cells", pct(before.top_decile_fraction), pct(after.top_decile_fraction));
    row("Max cell density", std::to_string(before.max_density), std::to_string(after.max_density));
    row("Median density (non-zero)", num(before.median_density_nonzero, 0), num(after.median_density_nonzero, 0));
    row("Mean density (non-zero)", num(before.mean_density_nonzero, 0), num(after.mean_density_nonzero, 0));
    row("Std density (non-zero)", num(before.std_density_nonzero, 0), num(after.std_density_nonzero, 0));
    row("Std/Mean ratio", num(before.dispersion(), 2), num(after.dispersion(), 2));
    row("X range", range(before.x_min, before.x_max), range(after.x_min, after.x_max));
    row("Y range", range(before.y_min, before.y_max), range(after.y_min, after.y_max));
    os << rule << "\n";
    return os.str();
}

} // namespace knowmap
