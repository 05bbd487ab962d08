#include <gtest/gtest.h>

#include <Eigen/Core>
#include <random>
#include <stdexcept>
#include <vector>

#include "lapjv/assignment_solvers/auction.hpp"
#include "lapjv/assignment_solvers/brute_force.hpp"
#include "lapjv/errors.hpp"
#include "lapjv/utils.hpp"

using lapjv::assignment_solvers::Auction;
using lapjv::assignment_solvers::AuctionParameters;

TEST(AuctionTests, TestAuctionMethod)
{
    Eigen::MatrixXd A(3, 3);
    A << 1, 2, 3,
         4, 2, 1,
         2, 2, 2;

    const Auction solver{AuctionParameters{}};
    const auto solution = solver.solve(A);

    EXPECT_DOUBLE_EQ(solution.cost, 4.0);
    EXPECT_EQ(solution.row_to_col, (std::vector<int>{0, 2, 1}));
    EXPECT_TRUE(lapjv::utils::is_perfect_matching(solution.row_to_col, solution.col_to_row));
}

TEST(AuctionTests, TestRewardMatrix)
{
    Eigen::MatrixXd A(4, 4);
    A << 10, 19, 8, 15,
         10, 18, 7, 17,
         13, 16, 9, 14,
         12, 19, 8, 18;

    const Auction solver{AuctionParameters{}};
    const auto solution = solver.solve(-A);
    const auto expected = lapjv::assignment_solvers::BruteForce{}.solve(-A);

    EXPECT_DOUBLE_EQ(solution.cost, expected.cost);
}

TEST(AuctionTests, TestMatchesBruteForceOnIntegerCosts)
{
    // With epsilon < 1 / n the auction is optimal for integer costs
    std::mt19937 rng(3);
    std::uniform_int_distribution<int> dist(0, 20);
    const Auction solver{AuctionParameters{}};
    const lapjv::assignment_solvers::BruteForce brute_force{};

    for (int n = 1; n <= 7; n++) {
        for (int t = 0; t < 10; t++) {
            Eigen::MatrixXd A(n, n);
            for (int i = 0; i < n; i++) {
                for (int j = 0; j < n; j++) {
                    A(i, j) = dist(rng);
                }
            }

            const auto solution = solver.solve(A);
            EXPECT_DOUBLE_EQ(solution.cost, brute_force.solve(A).cost) << "A:\n" << A;
        }
    }
}

TEST(AuctionTests, TestEpsilonComplementarySlackness)
{
    std::mt19937 rng(5);
    std::uniform_real_distribution<double> dist(0.0, 10.0);
    const int n = 12;
    Eigen::MatrixXd A(n, n);
    for (int i = 0; i < n; i++) {
        for (int j = 0; j < n; j++) {
            A(i, j) = dist(rng);
        }
    }

    const AuctionParameters params{1e-2, AuctionParameters::DEFAULT_MAX_ITERATIONS};
    const auto solution = Auction{params}.solve(A);

    ASSERT_TRUE(solution.has_duals());
    for (int i = 0; i < n; i++) {
        EXPECT_NEAR(solution.u(i) + solution.v(solution.row_to_col[i]), A(i, solution.row_to_col[i]), 1e-9);
        for (int j = 0; j < n; j++) {
            EXPECT_LE(solution.u(i) + solution.v(j), A(i, j) + params.epsilon + 1e-9);
        }
    }
}

TEST(AuctionTests, TestInvalidParameters)
{
    EXPECT_THROW(Auction(AuctionParameters{0.0, 10}), std::invalid_argument);
    EXPECT_THROW(Auction(AuctionParameters{-1.0, 10}), std::invalid_argument);
}

TEST(AuctionTests, TestIterationLimit)
{
    Eigen::MatrixXd A(3, 3);
    A << 1, 2, 3,
         4, 2, 1,
         2, 2, 2;

    const Auction solver{AuctionParameters{1e-3, 1}};
    EXPECT_THROW(solver.solve(A), lapjv::SolverError);
}

TEST(AuctionTests, TestRejectsNonSquare)
{
    const Auction solver{AuctionParameters{}};
    EXPECT_THROW(solver.solve(Eigen::MatrixXd::Ones(2, 3)), lapjv::InvalidDimension);
}
