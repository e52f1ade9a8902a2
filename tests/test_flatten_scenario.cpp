/**
 * Flattening Acceptance Scenario
 *
 * 1,000 primary points: a tight blob of 900 plus 100 spread over the whole
 * square. 50 secondary points scattered uniformly. Flattened with
 * cluster_count=20, neighbor_k=8, margin=0.02, seed=42 at mu=0.75.
 *
 * Checks the end-to-end behaviour a map consumer relies on:
 * 1. Empty area drops substantially against the mu=0 baseline
 * 2. All 1,050 outputs stay in the unit square
 * 3. Re-running gives the same layout
 * 4. Bad inputs fail with the right error type
 */

#include <iostream>
#include <iomanip>
#include <cmath>
#include <random>
#include <string>
#include <vector>

#include "knowmap/density.hpp"
#include "knowmap/error.hpp"
#include "knowmap/flatten.hpp"
#include "knowmap/geometry.hpp"
#include "knowmap/logging.hpp"

using namespace knowmap;

// Test result tracking
int tests_passed = 0;
int tests_failed = 0;

void check(bool condition, const std::string& name) {
    if (condition) {
        std::cout << "  ✓ " << name << std::endl;
        tests_passed++;
    } else {
        std::cout << "  ✗ " << name << " FAILED" << std::endl;
        tests_failed++;
    }
}

struct Scenario {
    PointSet primary;
    PointSet secondary;
    FlattenParameters params;
};

Scenario make_scenario() {
    std::mt19937 rng(42);
    std::normal_distribution<double> tight(0.0, 0.04);
    std::uniform_real_distribution<double> uni(0.0, 1.0);

    Scenario s;
    for (int i = 0; i < 900; ++i) {
        s.primary.push_back(clamp_unit({0.7 + tight(rng), 0.25 + tight(rng)}));
    }
    for (int i = 0; i < 100; ++i) {
        s.primary.push_back({uni(rng), uni(rng)});
    }
    for (int i = 0; i < 50; ++i) {
        s.secondary.push_back({uni(rng), uni(rng)});
    }

    s.params.cluster_count = 20;
    s.params.neighbor_k = 8;
    s.params.margin = 0.02;
    s.params.seed = 42;
    s.params.mu = 0.75;
    return s;
}

bool all_inside(const PointSet& pts) {
    for (const auto& p : pts) {
        if (!p.in_unit_square()) return false;
    }
    return true;
}

// =============================================================================
// Test: Density Redistribution
// =============================================================================
void test_redistribution(const Scenario& s) {
    std::cout << "\n=== Test: Density Redistribution ===" << std::endl;

    FlattenParameters baseline_params = s.params;
    baseline_params.mu = 0.0;
    FlattenResult baseline = flatten(s.primary, s.secondary, baseline_params);
    FlattenResult result = flatten(s.primary, s.secondary, s.params);

    const double before = baseline.metadata.density_after.empty_fraction;
    const double after = result.metadata.density_after.empty_fraction;
    std::cout << std::fixed << std::setprecision(1)
              << "  Empty cells: " << 100.0 * before << "% -> " << 100.0 * after << "%" << std::endl;

    check(after < before - 0.10, "Empty area drops substantially at mu=0.75");
    check(result.metadata.density_after.top_decile_fraction < result.metadata.density_before.top_decile_fraction,
          "Densest cells hold fewer points");
    check(result.flat_primary.size() == 1000 && result.flat_secondary.size() == 50, "Output sizes match input");
    check(all_inside(result.flat_primary) && all_inside(result.flat_secondary), "All 1050 outputs in unit square");

    const double overlap = neighborhood_preservation(s.primary, result.flat_primary, 10, 1000, 42);
    std::cout << std::setprecision(3) << "  Neighbourhood overlap: " << overlap << std::endl;
    check(overlap > 0.0 && overlap <= 1.0, "Neighbourhood overlap is a valid fraction");
}

// =============================================================================
// Test: Reproducibility
// =============================================================================
void test_reproducibility(const Scenario& s) {
    std::cout << "\n=== Test: Reproducibility ===" << std::endl;

    FlattenResult a = flatten(s.primary, s.secondary, s.params);
    FlattenResult b = flatten(s.primary, s.secondary, s.params);
    check(a.flat_primary == b.flat_primary, "Primary layout identical across runs");
    check(a.flat_secondary == b.flat_secondary, "Secondary layout identical across runs");

    FlattenParameters parallel = s.params;
    parallel.num_threads = 4;
    FlattenResult c = flatten(s.primary, s.secondary, parallel);
    check(a.flat_primary == c.flat_primary, "Four workers give the same layout as one");
}

// =============================================================================
// Test: Restore
// =============================================================================
void test_restore(const Scenario& s) {
    std::cout << "\n=== Test: Restore With mu=0 ===" << std::endl;

    FlattenParameters p = s.params;
    p.mu = 0.0;
    FlattenResult r = flatten(s.primary, s.secondary, p);
    check(r.flat_primary == s.primary, "Primary coordinates restored exactly");
    check(r.flat_secondary == s.secondary, "Secondary coordinates restored exactly");

    // Derived geometry follows the active layout
    FlattenResult flat = flatten(s.primary, s.secondary, s.params);
    CoordinateRemapper remap(s.primary, flat.flat_primary);
    auto hit = remap.remap(s.primary[123]);
    check(hit.has_value() && *hit == flat.flat_primary[123], "Original coordinate remaps to its flattened point");
}

// =============================================================================
// Test: Error Reporting
// =============================================================================
void test_errors(const Scenario& s) {
    std::cout << "\n=== Test: Error Reporting ===" << std::endl;

    FlattenParameters p = s.params;
    p.mu = 1.5;
    bool named_mu = false;
    try {
        flatten(s.primary, s.secondary, p);
    } catch (const InvalidParameterError& e) {
        named_mu = e.field() == "mu";
    }
    check(named_mu, "mu=1.5 rejected naming 'mu'");

    PointSet few;
    for (int i = 0; i < 30; ++i) few.push_back({0.1 * (i % 3) + 0.1, 0.5});
    p = s.params;
    p.cluster_count = 10;
    bool degenerate = false;
    try {
        flatten(few, {}, p);
    } catch (const DegenerateInputError&) {
        degenerate = true;
    }
    check(degenerate, "cluster_count above distinct points is degenerate");
}

int main() {
    std::cout << "Flattening Acceptance Scenario" << std::endl;
    std::cout << "==============================" << std::endl;

    set_log_level(LogLevel::WARN);

    const Scenario s = make_scenario();
    test_redistribution(s);
    test_reproducibility(s);
    test_restore(s);
    test_errors(s);

    std::cout << "\n==============================" << std::endl;
    if (tests_failed == 0) {
        std::cout << "  ✓ All " << tests_passed << " tests passed!" << std::endl;
    } else {
        std::cout << "  " << tests_failed << " failed, "
                  << tests_passed << " passed" << std::endl;
    }

    return tests_failed > 0 ? 1 : 0;
}
