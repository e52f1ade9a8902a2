// =============================================================================
// Assignment Solver Tests
// =============================================================================

#include <gtest/gtest.h>
#include "knowmap/assignment.hpp"
#include "knowmap/error.hpp"
#include <vector>
#include <random>
#include <limits>
#include <algorithm>
#include <numeric>

using namespace knowmap;

class AssignmentTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng.seed(42);
    }

    std::mt19937 rng;

    PointSet random_points(size_t n) {
        std::uniform_real_distribution<double> uni(0.0, 1.0);
        PointSet pts(n);
        for (auto& p : pts) p = {uni(rng), uni(rng)};
        return pts;
    }

    // Exhaustive minimum over all injective maps sources -> targets
    static double brute_force(const PointSet& sources, const PointSet& targets) {
        std::vector<size_t> perm(targets.size());
        std::iota(perm.begin(), perm.end(), size_t{0});
        double best = std::numeric_limits<double>::infinity();
        do {
            double cost = 0.0;
            for (size_t i = 0; i < sources.size(); ++i) cost += distance(sources[i], targets[perm[i]]);
            best = std::min(best, cost);
        } while (std::next_permutation(perm.begin(), perm.end()));
        return best;
    }

    static void expect_one_to_one(const Assignment& a, size_t sources, size_t targets) {
        ASSERT_EQ(a.target_of.size(), sources);
        std::vector<size_t> sorted = a.target_of;
        std::sort(sorted.begin(), sorted.end());
        EXPECT_EQ(std::unique(sorted.begin(), sorted.end()), sorted.end());
        for (size_t t : a.target_of) EXPECT_LT(t, targets);
    }

    static double cost_of(const Assignment& a, const PointSet& s, const PointSet& t) {
        double c = 0.0;
        for (size_t i = 0; i < s.size(); ++i) c += distance(s[i], t[a.target_of[i]]);
        return c;
    }
};

TEST_F(AssignmentTest, HungarianMatchesBruteForce) {
    HungarianAssigner hungarian;
    for (int trial = 0; trial < 20; ++trial) {
        const size_t n = 2 + static_cast<size_t>(trial % 6);
        PointSet s = random_points(n);
        PointSet t = random_points(n);

        auto a = hungarian.assign(s, t);
        expect_one_to_one(a, n, n);
        EXPECT_NEAR(a.total_cost, brute_force(s, t), 1e-9) << "trial " << trial;
        EXPECT_NEAR(a.total_cost, cost_of(a, s, t), 1e-12);
    }
}

TEST_F(AssignmentTest, HungarianRectangular) {
    HungarianAssigner hungarian;
    PointSet s = random_points(4);
    PointSet t = random_points(7);

    auto a = hungarian.assign(s, t);
    expect_one_to_one(a, 4, 7);
    EXPECT_NEAR(a.total_cost, brute_force(s, t), 1e-9);
}

TEST_F(AssignmentTest, HungarianOnExplicitMatrix) {
    Eigen::MatrixXd cost(3, 3);
    cost << 4, 1, 3,
            2, 0, 5,
            3, 2, 2;
    auto cols = HungarianAssigner::solve(cost);
    ASSERT_EQ(cols.size(), 3u);
    double total = 0.0;
    for (size_t i = 0; i < 3; ++i) total += cost(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(cols[i]));
    EXPECT_DOUBLE_EQ(total, 5.0);
}

TEST_F(AssignmentTest, IdenticalSourcesAndTargetsCostNothing) {
    HungarianAssigner hungarian;
    PointSet s = random_points(30);
    auto a = hungarian.assign(s, s);
    EXPECT_NEAR(a.total_cost, 0.0, 1e-12);
    for (size_t i = 0; i < s.size(); ++i) EXPECT_EQ(a.target_of[i], i);
}

TEST_F(AssignmentTest, ZeroVarianceSources) {
    HungarianAssigner hungarian;
    PointSet s(5, Point2D{0.5, 0.5});
    PointSet t = random_points(5);
    auto a = hungarian.assign(s, t);
    expect_one_to_one(a, 5, 5);
}

TEST_F(AssignmentTest, EqualCostTiesAreDeterministic) {
    HungarianAssigner hungarian;
    PointSet s(4, Point2D{0.5, 0.5});
    PointSet t = {{0.4, 0.5}, {0.6, 0.5}, {0.5, 0.4}, {0.5, 0.6}};
    auto a = hungarian.assign(s, t);
    auto b = hungarian.assign(s, t);
    EXPECT_EQ(a.target_of, b.target_of);
}

TEST_F(AssignmentTest, MoreSourcesThanTargetsRejected) {
    HungarianAssigner hungarian;
    GreedyAssigner greedy;
    PointSet s = random_points(5);
    PointSet t = random_points(3);
    EXPECT_THROW(hungarian.assign(s, t), InvalidParameterError);
    EXPECT_THROW(greedy.assign(s, t), InvalidParameterError);
}

TEST_F(AssignmentTest, NonFiniteCostRejected) {
    Eigen::MatrixXd cost = Eigen::MatrixXd::Ones(2, 2);
    cost(1, 0) = std::numeric_limits<double>::infinity();
    EXPECT_THROW(HungarianAssigner::solve(cost), NumericalError);
}

TEST_F(AssignmentTest, EmptyProblem) {
    HungarianAssigner hungarian;
    auto a = hungarian.assign({}, random_points(3));
    EXPECT_TRUE(a.target_of.empty());
    EXPECT_DOUBLE_EQ(a.total_cost, 0.0);
}

TEST_F(AssignmentTest, GreedyIsValidAndNearOptimal) {
    HungarianAssigner hungarian;
    GreedyAssigner greedy;
    PointSet s = random_points(60);
    PointSet t = random_points(60);

    auto exact = hungarian.assign(s, t);
    auto approx = greedy.assign(s, t);

    expect_one_to_one(approx, 60, 60);
    EXPECT_NEAR(approx.total_cost, cost_of(approx, s, t), 1e-9);
    EXPECT_GE(approx.total_cost, exact.total_cost - 1e-9);
    EXPECT_LE(approx.total_cost, exact.total_cost * 1.5);
}

TEST_F(AssignmentTest, DistanceMatrixShape) {
    PointSet s = {{0.0, 0.0}, {1.0, 0.0}};
    PointSet t = {{0.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}};
    auto m = distance_matrix(s, t);
    ASSERT_EQ(m.rows(), 2);
    ASSERT_EQ(m.cols(), 3);
    EXPECT_DOUBLE_EQ(m(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(m(0, 1), 1.0);
    EXPECT_NEAR(m(1, 1), std::sqrt(2.0), 1e-15);
}
