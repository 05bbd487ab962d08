#include "lapjv/assignment_solvers/brute_force.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <range/v3/all.hpp>
#include <utility>

#include "lapjv/errors.hpp"
#include "lapjv/utils.hpp"
#include "lapjv/validation.hpp"

namespace lapjv::assignment_solvers
{

types::Solution BruteForce::solve(const Eigen::Ref<const Eigen::MatrixXd>& cost_matrix) const
{
    validation::validate_cost_matrix(cost_matrix);

    const auto n = static_cast<int>(cost_matrix.rows());
    if (n > MAX_DIMENSION) {
        throw InvalidDimension(fmt::format("Brute force supports at most {} rows, got {}", MAX_DIMENSION, n));
    }

    spdlog::debug("Enumerating all assignments of cost_matrix size ({}, {})", n, n);

    // Permutations are visited in lexicographic order, so ties keep the first one
    auto permutation = ranges::views::iota(0, n) | ranges::to<std::vector<int>>();
    auto best = permutation;
    double best_cost = utils::assignment_cost(cost_matrix, permutation);

    while (std::next_permutation(permutation.begin(), permutation.end())) {
        const auto cost = utils::assignment_cost(cost_matrix, permutation);
        if (cost < best_cost) {
            best_cost = cost;
            best = permutation;
        }
    }

    types::Solution solution{};
    solution.cost = best_cost;
    solution.col_to_row = utils::invert_assignment(best);
    solution.row_to_col = std::move(best);
    return solution;
}

}  // namespace lapjv::assignment_solvers
