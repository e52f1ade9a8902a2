// =============================================================================
// Capacitated Target Layout Tests
// =============================================================================

#include <gtest/gtest.h>
#include "knowmap/target_layout.hpp"
#include "knowmap/clustering.hpp"
#include "knowmap/halton.hpp"
#include "knowmap/error.hpp"
#include <vector>
#include <random>
#include <numeric>

using namespace knowmap;

class TargetLayoutTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng.seed(42);
    }

    std::mt19937 rng;

    static std::vector<size_t> count_labels(const std::vector<size_t>& labels, size_t k) {
        std::vector<size_t> counts(k, 0);
        for (size_t l : labels) {
            EXPECT_LT(l, k);
            if (l < k) ++counts[l];
        }
        return counts;
    }
};

TEST_F(TargetLayoutTest, TargetCountsEqualClusterSizes) {
    std::normal_distribution<double> noise(0.0, 0.05);
    PointSet pts;
    for (int i = 0; i < 700; ++i) pts.push_back(clamp_unit({0.25 + noise(rng), 0.3 + noise(rng)}));
    for (int i = 0; i < 300; ++i) pts.push_back(clamp_unit({0.75 + noise(rng), 0.7 + noise(rng)}));

    KMeansClusterer kmeans;
    Rng r(42);
    auto clusters = kmeans.cluster(pts, 12, r);
    PointSet targets = scrambled_halton_points(pts.size(), 0.02, r);

    auto labels = assign_targets_to_clusters(targets, clusters.centroids, clusters.sizes);

    ASSERT_EQ(labels.size(), targets.size());
    EXPECT_EQ(count_labels(labels, 12), clusters.sizes);
}

TEST_F(TargetLayoutTest, NearestClusterWinsWhenCapacityAllows) {
    PointSet centroids = {{0.25, 0.5}, {0.75, 0.5}};
    PointSet targets = {{0.1, 0.5}, {0.9, 0.5}, {0.2, 0.2}, {0.8, 0.8}};
    auto labels = assign_targets_to_clusters(targets, centroids, {2, 2});
    EXPECT_EQ(labels, (std::vector<size_t>{0, 1, 0, 1}));
}

TEST_F(TargetLayoutTest, OverflowGoesToNextNearest) {
    // Cluster 0 has room for one target; the closest bidder keeps it
    PointSet centroids = {{0.1, 0.1}, {0.9, 0.9}};
    PointSet targets = {{0.3, 0.3}, {0.15, 0.1}, {0.4, 0.4}};
    auto labels = assign_targets_to_clusters(targets, centroids, {1, 2});
    EXPECT_EQ(labels, (std::vector<size_t>{1, 0, 1}));
}

TEST_F(TargetLayoutTest, EqualDistanceBiddersKeepLowerIndex) {
    PointSet centroids = {{0.5, 0.5}, {0.5, 0.9}};
    PointSet targets = {{0.4, 0.5}, {0.6, 0.5}};
    auto labels = assign_targets_to_clusters(targets, centroids, {1, 1});
    EXPECT_EQ(labels, (std::vector<size_t>{0, 1}));
}

TEST_F(TargetLayoutTest, SingleCluster) {
    PointSet targets = halton_points(50, 0.0);
    auto labels = assign_targets_to_clusters(targets, {{0.5, 0.5}}, {50});
    EXPECT_EQ(labels, std::vector<size_t>(50, 0));
}

TEST_F(TargetLayoutTest, ManyClustersDeepRounds) {
    // Every target prefers cluster 0 first, so most go through many rounds
    PointSet centroids;
    std::vector<size_t> caps;
    for (int c = 0; c < 40; ++c) {
        centroids.push_back({0.5 + 0.01 * c, 0.5});
        caps.push_back(5);
    }
    PointSet targets(200, Point2D{0.0, 0.5});
    for (size_t i = 0; i < targets.size(); ++i) targets[i].y = 0.5 + 1e-4 * static_cast<double>(i);

    auto labels = assign_targets_to_clusters(targets, centroids, caps);
    EXPECT_EQ(count_labels(labels, 40), caps);
}

TEST_F(TargetLayoutTest, CapacityMismatchIsInternalError) {
    PointSet targets = halton_points(10, 0.0);
    PointSet centroids = {{0.3, 0.3}, {0.6, 0.6}};
    EXPECT_THROW(assign_targets_to_clusters(targets, centroids, {5, 4}), KnowmapException);
    EXPECT_THROW(assign_targets_to_clusters(targets, centroids, {10}), KnowmapException);
}
