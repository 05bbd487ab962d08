#ifndef LAPJV_VALIDATION_HPP
#define LAPJV_VALIDATION_HPP

#include <Eigen/Core>
#include <vector>

namespace lapjv::validation
{

// Throws InvalidDimension for empty or non-square matrices and NonFiniteCost for NaN/inf entries.
void validate_cost_matrix(const Eigen::Ref<const Eigen::MatrixXd>& cost_matrix);

// Copies a row-major nested vector into a validated dim x dim cost matrix.
Eigen::MatrixXd to_cost_matrix(const int dim, const std::vector<std::vector<double>>& rows);

}  // namespace lapjv::validation

#endif  // LAPJV_VALIDATION_HPP
