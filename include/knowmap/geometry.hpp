#pragma once

/**
 * Derived geometry recomputed from active (possibly flattened) coordinates.
 *
 * Any change of mu moves points, so region boxes and grid labels are always
 * derived from the current layout rather than cached.
 */

#include "knowmap/types.hpp"
#include "knowmap/knn_index.hpp"

#include <optional>

namespace knowmap {

struct BoundingBox {
    double x_min = 0.0;
    double x_max = 1.0;
    double y_min = 0.0;
    double y_max = 1.0;

    double width() const { return x_max - x_min; }
    double height() const { return y_max - y_min; }
    bool contains(const Point2D& p) const {
        return p.x >= x_min && p.x <= x_max && p.y >= y_min && p.y <= y_max;
    }
};

/**
 * Axis-aligned min/max box. Spans smaller than min_size are widened around
 * their centre, then each side is padded by margin_fraction of the span and
 * the result is clipped to the unit square. nullopt for an empty set.
 */
std::optional<BoundingBox> bounding_box(const PointSet& points, double margin_fraction = 0.02,
                                        double min_size = 0.05);

/**
 * Robust box from the lo_pct..hi_pct percentiles (linear interpolation),
 * widened to at least min_span, padded by an absolute margin and clipped to
 * the unit square. Returns the whole unit square for an empty set.
 */
BoundingBox percentile_box(const PointSet& points, double lo_pct = 5.0, double hi_pct = 95.0,
                           double margin = 0.05, double min_span = 0.15);

struct GridCell {
    int col;
    int row;

    bool operator==(const GridCell& o) const { return col == o.col && row == o.row; }
};

// Label cell of p on a grid_size x grid_size grid over the unit square
GridCell grid_cell(const Point2D& p, int grid_size);

/**
 * Maps coordinates given in the original layout onto the flattened layout.
 * Lookup is by nearest original point; misses beyond tolerance yield nullopt.
 */
class CoordinateRemapper {
public:
    CoordinateRemapper(const PointSet& original, const PointSet& flattened, double tolerance = 1e-6);

    std::optional<Point2D> remap(const Point2D& original_coord) const;

    double tolerance() const { return tolerance_; }

private:
    PointSet flattened_;
    NeighborIndex index_;
    double tolerance_;
};

} // namespace knowmap
