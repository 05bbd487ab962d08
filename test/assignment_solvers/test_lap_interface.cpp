#include <gtest/gtest.h>

#include <limits>
#include <vector>

#include "lapjv/errors.hpp"
#include "lapjv/lap.hpp"
#include "lapjv/utils.hpp"
#include "lapjv/validation.hpp"

TEST(LapTests, TestNestedVectorInput)
{
    const std::vector<std::vector<double>> cost_matrix{{1, 2, 3}, {4, 2, 1}, {2, 2, 2}};

    const auto solution = lapjv::lap(3, cost_matrix);

    EXPECT_DOUBLE_EQ(solution.cost, 4.0);
    EXPECT_EQ(solution.row_to_col, (std::vector<int>{0, 2, 1}));
    EXPECT_EQ(solution.col_to_row, (std::vector<int>{0, 2, 1}));
    ASSERT_EQ(solution.u.size(), 3);
    ASSERT_EQ(solution.v.size(), 3);
}

TEST(LapTests, TestToCostMatrix)
{
    const auto A = lapjv::validation::to_cost_matrix(2, {{1.5, -2}, {3, 4}});

    ASSERT_EQ(A.rows(), 2);
    ASSERT_EQ(A.cols(), 2);
    EXPECT_DOUBLE_EQ(A(0, 1), -2.0);
    EXPECT_DOUBLE_EQ(A(1, 0), 3.0);
    EXPECT_DOUBLE_EQ(lapjv::utils::assignment_cost(A, {1, 0}), 1.0);
}

TEST(LapTests, TestInvalidDimension)
{
    EXPECT_THROW(lapjv::lap(0, {}), lapjv::InvalidDimension);
    EXPECT_THROW(lapjv::lap(-1, {}), lapjv::InvalidDimension);

    // Too few rows
    EXPECT_THROW(lapjv::lap(2, {{1, 2}}), lapjv::InvalidDimension);

    // Ragged rows
    EXPECT_THROW(lapjv::lap(2, {{1, 2}, {3}}), lapjv::InvalidDimension);
    EXPECT_THROW(lapjv::lap(2, {{1, 2}, {3, 4, 5}}), lapjv::InvalidDimension);
}

TEST(LapTests, TestNonFiniteCost)
{
    const auto nan = std::numeric_limits<double>::quiet_NaN();
    const auto inf = std::numeric_limits<double>::infinity();

    try {
        lapjv::lap(2, {{1, 2}, {nan, 4}});
        FAIL() << "Expected NonFiniteCost";
    }
    catch (const lapjv::NonFiniteCost& err) {
        EXPECT_EQ(err.row(), 1);
        EXPECT_EQ(err.col(), 0);
    }

    EXPECT_THROW(lapjv::lap(2, {{1, -inf}, {3, 4}}), lapjv::LapError);
}
