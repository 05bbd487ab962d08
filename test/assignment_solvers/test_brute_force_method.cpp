#include <gtest/gtest.h>

#include <Eigen/Core>
#include <vector>

#include "lapjv/assignment_solvers/brute_force.hpp"
#include "lapjv/errors.hpp"

using lapjv::assignment_solvers::BruteForce;

TEST(BruteForceTests, TestBruteForceMethod)
{
    Eigen::MatrixXd A(3, 3);
    A << 1, 2, 3,
         4, 2, 1,
         2, 2, 2;

    const auto solution = BruteForce{}.solve(A);

    EXPECT_DOUBLE_EQ(solution.cost, 4.0);
    EXPECT_EQ(solution.row_to_col, (std::vector<int>{0, 2, 1}));
    EXPECT_EQ(solution.col_to_row, (std::vector<int>{0, 2, 1}));
    EXPECT_FALSE(solution.has_duals());
}

TEST(BruteForceTests, TestTiesKeepFirstPermutation)
{
    const auto solution = BruteForce{}.solve(Eigen::MatrixXd::Constant(4, 4, 2.0));

    EXPECT_DOUBLE_EQ(solution.cost, 8.0);
    EXPECT_EQ(solution.row_to_col, (std::vector<int>{0, 1, 2, 3}));
}

TEST(BruteForceTests, TestDimensionLimit)
{
    const int n = BruteForce::MAX_DIMENSION + 1;
    EXPECT_THROW(BruteForce{}.solve(Eigen::MatrixXd::Zero(n, n)), lapjv::InvalidDimension);
}
