#include "knowmap/geometry.hpp"
#include "knowmap/error.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace knowmap {

namespace {

// numpy-style linear percentile of an unsorted sample
double percentile(std::vector<double> values, double pct) {
    std::sort(values.begin(), values.end());
    const double pos = (pct / 100.0) * static_cast<double>(values.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = std::min(lo + 1, values.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return values[lo] + (values[hi] - values[lo]) * frac;
}

void widen(double& lo, double& hi, double min_span) {
    if (hi - lo < min_span) {
        const double centre = 0.5 * (lo + hi);
        lo = centre - 0.5 * min_span;
        hi = centre + 0.5 * min_span;
    }
}

} // namespace

std::optional<BoundingBox> bounding_box(const PointSet& points, double margin_fraction, double min_size) {
    if (points.empty()) return std::nullopt;

    BoundingBox box{points[0].x, points[0].x, points[0].y, points[0].y};
    for (const auto& p : points) {
        box.x_min = std::min(box.x_min, p.x);
        box.x_max = std::max(box.x_max, p.x);
        box.y_min = std::min(box.y_min, p.y);
        box.y_max = std::max(box.y_max, p.y);
    }

    widen(box.x_min, box.x_max, min_size);
    widen(box.y_min, box.y_max, min_size);

    const double pad_x = box.width() * margin_fraction;
    const double pad_y = box.height() * margin_fraction;
    box.x_min = std::max(0.0, box.x_min - pad_x);
    box.x_max = std::min(1.0, box.x_max + pad_x);
    box.y_min = std::max(0.0, box.y_min - pad_y);
    box.y_max = std::min(1.0, box.y_max + pad_y);
    return box;
}

BoundingBox percentile_box(const PointSet& points, double lo_pct, double hi_pct,
                           double margin, double min_span) {
    KNOWMAP_CHECK_PARAM(lo_pct >= 0.0 && lo_pct <= hi_pct && hi_pct <= 100.0, "percentiles",
                        "0 <= lo_pct <= hi_pct <= 100");
    if (points.empty()) return BoundingBox{};

    std::vector<double> xs, ys;
    xs.reserve(points.size());
    ys.reserve(points.size());
    for (const auto& p : points) {
        xs.push_back(p.x);
        ys.push_back(p.y);
    }

    BoundingBox box{percentile(xs, lo_pct), percentile(xs, hi_pct),
                    percentile(ys, lo_pct), percentile(ys, hi_pct)};
    widen(box.x_min, box.x_max, min_span);
    widen(box.y_min, box.y_max, min_span);

    box.x_min = std::max(0.0, box.x_min - margin);
    box.x_max = std::min(1.0, box.x_max + margin);
    box.y_min = std::max(0.0, box.y_min - margin);
    box.y_max = std::min(1.0, box.y_max + margin);
    return box;
}

GridCell grid_cell(const Point2D& p, int grid_size) {
    KNOWMAP_CHECK_PARAM(grid_size > 0, "grid_size", "grid_size > 0");
    const auto cell = [grid_size](double v) {
        return std::clamp(static_cast<int>(std::floor(v * grid_size)), 0, grid_size - 1);
    };
    return {cell(p.x), cell(p.y)};
}

CoordinateRemapper::CoordinateRemapper(const PointSet& original, const PointSet& flattened, double tolerance)
    : flattened_(flattened), index_(original), tolerance_(tolerance) {
    KNOWMAP_CHECK_PARAM(original.size() == flattened.size(), "flattened",
                        "same number of points as original");
    KNOWMAP_CHECK_PARAM(tolerance >= 0.0, "tolerance", "tolerance >= 0");
}

std::optional<Point2D> CoordinateRemapper::remap(const Point2D& original_coord) const {
    const auto hits = index_.query(original_coord, 1);
    if (hits.empty() || hits.front().distance > tolerance_) return std::nullopt;
    return flattened_[hits.front().index];
}

} // namespace knowmap
