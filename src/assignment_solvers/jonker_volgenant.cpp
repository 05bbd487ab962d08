#include "lapjv/assignment_solvers/jonker_volgenant.hpp"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

#include "lapjv/validation.hpp"

namespace lapjv::assignment_solvers
{

namespace
{

using CostMatrix = Eigen::Ref<const Eigen::MatrixXd>;

struct State
{
    explicit State(const int n) : row_to_col(n, -1), col_to_row(n, -1), v(Eigen::VectorXd::Zero(n)), matches(n, 0)
    {
        free_rows.reserve(n);
    }

    std::vector<int> row_to_col;
    std::vector<int> col_to_row;
    Eigen::VectorXd v;

    // Number of columns for which a row was the cheapest during column reduction
    std::vector<int> matches;

    // Unassigned rows. Indexed rather than queued so a displaced row can be put back at the scan position.
    std::vector<int> free_rows;
};

void column_reduction(const CostMatrix& cost_matrix, State& state)
{
    const auto n = static_cast<int>(cost_matrix.rows());

    // Reverse order gives fewer free rows later on
    for (int j = n - 1; j >= 0; j--) {
        int imin = 0;
        double min = cost_matrix(0, j);
        for (int i = 1; i < n; i++) {
            if (cost_matrix(i, j) < min) {
                min = cost_matrix(i, j);
                imin = i;
            }
        }
        state.v(j) = min;

        if (++state.matches[imin] == 1) {
            state.row_to_col[imin] = j;
            state.col_to_row[j] = imin;
        }
        else if (state.v(j) < state.v(state.row_to_col[imin])) {
            const auto j1 = state.row_to_col[imin];
            state.row_to_col[imin] = j;
            state.col_to_row[j] = imin;
            state.col_to_row[j1] = -1;
        }
        else {
            state.col_to_row[j] = -1;
        }
    }
}

void reduction_transfer(const CostMatrix& cost_matrix, const ScaleConstants& scale, State& state)
{
    const auto n = static_cast<int>(cost_matrix.rows());

    for (int i = 0; i < n; i++) {
        if (state.matches[i] == 0) {
            state.free_rows.push_back(i);
        }
        else if (state.matches[i] == 1) {
            const auto j1 = state.row_to_col[i];
            double min = scale.big;
            for (int j = 0; j < n; j++) {
                if (j == j1) {
                    continue;
                }
                const auto h = cost_matrix(i, j) - state.v(j);
                if (h < min + scale.epsilon) {
                    min = h;
                }
            }
            state.v(j1) -= min;
        }
    }
}

void augmenting_row_reduction(const CostMatrix& cost_matrix, const ScaleConstants& scale, State& state)
{
    constexpr int NUM_PASSES = 2;
    const auto n = static_cast<int>(cost_matrix.rows());

    for (int pass = 0; pass < NUM_PASSES; pass++) {
        auto& free_rows = state.free_rows;
        std::vector<int> still_free{};
        still_free.reserve(n);

        std::size_t k = 0;
        while (k < free_rows.size()) {
            const auto i = free_rows[k];
            k++;

            // Minimum and second minimum reduced cost over the columns
            double umin = cost_matrix(i, 0) - state.v(0);
            double usubmin = scale.big;
            int j1 = 0;
            int j2 = 0;
            for (int j = 1; j < n; j++) {
                const auto h = cost_matrix(i, j) - state.v(j);
                if (h < usubmin) {
                    if (h >= umin) {
                        usubmin = h;
                        j2 = j;
                    }
                    else {
                        usubmin = umin;
                        umin = h;
                        j2 = j1;
                        j1 = j;
                    }
                }
            }

            auto i0 = state.col_to_row[j1];
            if (umin < usubmin + scale.epsilon) {
                // Raise the reduced cost of j1 in row i up to the second minimum
                state.v(j1) -= usubmin + scale.epsilon - umin;
            }
            else if (i0 >= 0) {
                // Equal minima and j1 is taken, j2 may be free
                j1 = j2;
                i0 = state.col_to_row[j2];
            }

            state.row_to_col[i] = j1;
            state.col_to_row[j1] = i;

            if (i0 >= 0) {
                if (umin < usubmin) {
                    // Continue the augmenting path i - j1 with i0 right away
                    k--;
                    free_rows[k] = i0;
                }
                else {
                    still_free.push_back(i0);
                }
            }
        }

        free_rows = std::move(still_free);
        spdlog::debug("Augmenting row reduction pass {} left {} free rows", pass + 1, free_rows.size());
    }
}

void augment(const CostMatrix& cost_matrix, State& state)
{
    const auto n = static_cast<int>(cost_matrix.rows());
    auto& v = state.v;
    auto& row_to_col = state.row_to_col;
    auto& col_to_row = state.col_to_row;

    std::vector<double> distance(n);
    std::vector<int> predecessor(n);

    // Columns [0, low) are finalized, [low, up) are at the current minimum distance and [up, n) are unvisited
    std::vector<int> col_list(n);

    for (const auto freerow : state.free_rows) {
        for (int j = 0; j < n; j++) {
            distance[j] = cost_matrix(freerow, j) - v(j);
            predecessor[j] = freerow;
            col_list[j] = j;
        }

        int low = 0;
        int up = 0;
        int last = 0;
        int end_of_path = -1;
        double min = 0.0;
        bool unassigned_found = false;

        do {
            if (up == low) {
                last = low - 1;

                // Move every unvisited column at the new minimum distance into [low, up)
                min = distance[col_list[up++]];
                for (int k = up; k < n; k++) {
                    const auto j = col_list[k];
                    const auto h = distance[j];
                    if (h <= min) {
                        if (h < min) {
                            up = low;
                            min = h;
                        }
                        col_list[k] = col_list[up];
                        col_list[up++] = j;
                    }
                }

                for (int k = low; k < up; k++) {
                    if (col_to_row[col_list[k]] < 0) {
                        end_of_path = col_list[k];
                        unassigned_found = true;
                        break;
                    }
                }
            }

            if (!unassigned_found) {
                // Relax the unvisited columns through the row owning the next column at the minimum
                const auto j1 = col_list[low];
                low++;
                const auto i = col_to_row[j1];
                const auto h = cost_matrix(i, j1) - v(j1) - min;

                for (int k = up; k < n; k++) {
                    const auto j = col_list[k];
                    const auto v2 = cost_matrix(i, j) - v(j) - h;
                    if (v2 < distance[j]) {
                        predecessor[j] = i;
                        if (v2 == min) {
                            if (col_to_row[j] < 0) {
                                end_of_path = j;
                                unassigned_found = true;
                                break;
                            }
                            col_list[k] = col_list[up];
                            col_list[up++] = j;
                        }
                        distance[j] = v2;
                    }
                }
            }
        } while (!unassigned_found);

        // Price update of the finalized columns
        for (int k = 0; k <= last; k++) {
            const auto j1 = col_list[k];
            v(j1) += distance[j1] - min;
        }

        // Flip the alternating path back to freerow
        int i = -1;
        do {
            i = predecessor[end_of_path];
            col_to_row[end_of_path] = i;
            const auto j1 = end_of_path;
            end_of_path = row_to_col[i];
            row_to_col[i] = j1;
        } while (i != freerow);
    }
}

types::Solution finalize(const CostMatrix& cost_matrix, State& state)
{
    const auto n = static_cast<int>(cost_matrix.rows());

    types::Solution solution{};
    solution.u = Eigen::VectorXd::Zero(n);
    for (int i = 0; i < n; i++) {
        const auto j = state.row_to_col[i];
        solution.u(i) = cost_matrix(i, j) - state.v(j);
        solution.cost += cost_matrix(i, j);
    }
    solution.row_to_col = std::move(state.row_to_col);
    solution.col_to_row = std::move(state.col_to_row);
    solution.v = std::move(state.v);
    return solution;
}

}  // namespace

ScaleConstants estimate_scale(const Eigen::Ref<const Eigen::MatrixXd>& cost_matrix)
{
    const auto mean = cost_matrix.cwiseAbs().sum() / static_cast<double>(cost_matrix.rows());
    return ScaleConstants{ScaleConstants::SCALE_FACTOR * mean, mean / ScaleConstants::SCALE_FACTOR};
}

types::Solution JonkerVolgenant::solve(const Eigen::Ref<const Eigen::MatrixXd>& cost_matrix) const
{
    validation::validate_cost_matrix(cost_matrix);

    const auto n = static_cast<int>(cost_matrix.rows());
    spdlog::debug("Starting Jonker-Volgenant with cost_matrix size ({}, {})", n, n);

    const auto scale = estimate_scale(cost_matrix);
    if (scale.epsilon == 0.0) {
        spdlog::warn("Cost matrix is all zeros, ties are broken by exact comparison");
    }

    State state{n};

    column_reduction(cost_matrix, state);
    reduction_transfer(cost_matrix, scale, state);
    spdlog::debug("Column reduction left {} free rows", state.free_rows.size());

    augmenting_row_reduction(cost_matrix, scale, state);
    augment(cost_matrix, state);

    auto solution = finalize(cost_matrix, state);
    spdlog::debug("Jonker-Volgenant finished with total cost {}", solution.cost);
    return solution;
}

}  // namespace lapjv::assignment_solvers
