#pragma once

/**
 * Low-discrepancy target layouts
 *
 * The flattener needs N quasi-uniform target slots inside the unit square
 * inset by a margin. Halton points (bases 2 and 3) cover the square more
 * evenly than random samples and without the axis-aligned artifacts of a
 * regular grid.
 */

#include "knowmap/types.hpp"
#include "knowmap/rng.hpp"

#include <cstdint>
#include <vector>

namespace knowmap {

/**
 * Van der Corput radical inverse of index in the given base.
 * radical_inverse(6, 2) = 0.011b = 0.375
 */
double radical_inverse(uint64_t index, unsigned base);

/**
 * n Halton points (bases 2, 3), indices 1..n, scaled into
 * [margin, 1 - margin]^2.
 */
PointSet halton_points(size_t n, double margin);

/**
 * n scrambled Halton points. Every digit position of each base gets an
 * independent random digit permutation drawn from rng, which keeps the
 * low-discrepancy structure while decorrelating layouts for different seeds.
 * Indices 0..n-1, scaled into [margin, 1 - margin]^2.
 */
PointSet scrambled_halton_points(size_t n, double margin, Rng& rng);

} // namespace knowmap
