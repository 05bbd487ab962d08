#include "lapjv/assignment_solvers/auction.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <deque>
#include <limits>
#include <range/v3/all.hpp>
#include <stdexcept>
#include <utility>

#include "lapjv/errors.hpp"
#include "lapjv/utils.hpp"
#include "lapjv/validation.hpp"

namespace lapjv::assignment_solvers
{

AuctionParameters::AuctionParameters() : AuctionParameters(DEFAULT_EPSILON, DEFAULT_MAX_ITERATIONS)
{
}

AuctionParameters::AuctionParameters(const double eps, const uint64_t max_iter) : epsilon(eps), max_iterations(max_iter)
{
}

Auction::Auction(const AuctionParameters& params) : m_eps(params.epsilon), m_max_iter(params.max_iterations)
{
    if (!(m_eps > 0.0)) {
        throw std::invalid_argument(fmt::format("Auction epsilon must be positive, got {}", m_eps));
    }
}

types::Solution Auction::solve(const Eigen::Ref<const Eigen::MatrixXd>& cost_matrix) const
{
    validation::validate_cost_matrix(cost_matrix);

    const auto n = static_cast<int>(cost_matrix.rows());

    spdlog::debug("Starting auction with cost_matrix size ({}, {})", n, n);

    std::deque<int> unassigned_queue;
    std::vector<int> row_to_col(n, -1);
    std::vector<int> col_to_row(n, -1);

    for (int i = 0; i < n; i++) {
        unassigned_queue.push_back(i);
    }

    Eigen::VectorXd prices = Eigen::VectorXd::Zero(n);

    uint64_t curr_iter = 0;

    while (!unassigned_queue.empty() && curr_iter < m_max_iter) {
        const auto i = unassigned_queue.front();
        unassigned_queue.pop_front();

        // Cheapest and second cheapest column for row i at the current prices
        int j_star = 0;
        double best = cost_matrix(i, 0) + prices(0);
        double second = std::numeric_limits<double>::infinity();
        for (int j = 1; j < n; j++) {
            const auto value = cost_matrix(i, j) + prices(j);
            if (value < best) {
                second = best;
                best = value;
                j_star = j;
            }
            else if (value < second) {
                second = value;
            }
        }
        if (n == 1) {
            second = best;
        }

        const auto prev_owner = col_to_row[j_star];
        if (prev_owner >= 0) {
            // The column has a previous owner
            row_to_col[prev_owner] = -1;
            unassigned_queue.push_back(prev_owner);
        }
        col_to_row[j_star] = i;
        row_to_col[i] = j_star;

        prices(j_star) += second - best + m_eps;
        curr_iter++;
    }

    if (!unassigned_queue.empty()) {
        spdlog::error("Auction terminated early!");
        throw SolverError(fmt::format("Auction left {} rows unassigned after {} iterations", unassigned_queue.size(),
                                      curr_iter));
    }
    spdlog::debug("Auction terminated successfully after {} iterations!", curr_iter);

    for (auto&& [row, col] : row_to_col | ranges::views::enumerate) {
        spdlog::trace("Row {} assigned to column {}", row, col);
    }

    types::Solution solution{};
    solution.cost = utils::assignment_cost(cost_matrix, row_to_col);
    solution.v = -prices;
    solution.u = Eigen::VectorXd::Zero(n);
    for (int i = 0; i < n; i++) {
        solution.u(i) = cost_matrix(i, row_to_col[i]) - solution.v(row_to_col[i]);
    }
    solution.row_to_col = std::move(row_to_col);
    solution.col_to_row = std::move(col_to_row);
    return solution;
}

}  // namespace lapjv::assignment_solvers
