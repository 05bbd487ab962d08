#include "lapjv/validation.hpp"

#include <fmt/format.h>

#include <cmath>

#include "lapjv/errors.hpp"

namespace lapjv::validation
{

void validate_cost_matrix(const Eigen::Ref<const Eigen::MatrixXd>& cost_matrix)
{
    const auto rows = cost_matrix.rows();
    const auto cols = cost_matrix.cols();

    if (rows == 0 || cols == 0) {
        throw InvalidDimension("Cost matrix is empty");
    }
    if (rows != cols) {
        throw InvalidDimension(fmt::format("Cost matrix must be square, got ({}, {})", rows, cols));
    }

    if (cost_matrix.allFinite()) {
        return;
    }
    for (Eigen::Index i = 0; i < rows; i++) {
        for (Eigen::Index j = 0; j < cols; j++) {
            if (!std::isfinite(cost_matrix(i, j))) {
                throw NonFiniteCost(static_cast<int>(i), static_cast<int>(j), cost_matrix(i, j));
            }
        }
    }
}

Eigen::MatrixXd to_cost_matrix(const int dim, const std::vector<std::vector<double>>& rows)
{
    if (dim <= 0) {
        throw InvalidDimension(fmt::format("Dimension must be positive, got {}", dim));
    }
    if (rows.size() != static_cast<std::size_t>(dim)) {
        throw InvalidDimension(fmt::format("Expected {} rows, got {}", dim, rows.size()));
    }

    Eigen::MatrixXd cost_matrix(dim, dim);
    for (int i = 0; i < dim; i++) {
        const auto& row = rows[i];
        if (row.size() != static_cast<std::size_t>(dim)) {
            throw InvalidDimension(fmt::format("Row {} has {} entries, expected {}", i, row.size(), dim));
        }
        for (int j = 0; j < dim; j++) {
            cost_matrix(i, j) = row[j];
        }
    }

    validate_cost_matrix(cost_matrix);
    return cost_matrix;
}

}  // namespace lapjv::validation
