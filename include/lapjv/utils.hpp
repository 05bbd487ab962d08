#ifndef LAPJV_UTILS_HPP
#define LAPJV_UTILS_HPP

#include <Eigen/Core>
#include <vector>

namespace lapjv::utils
{

// Sum of cost_matrix(i, row_to_col[i]) over all rows
inline double assignment_cost(const Eigen::Ref<const Eigen::MatrixXd>& cost_matrix,
                              const std::vector<int>& row_to_col)
{
    double total = 0.0;
    for (int i = 0; i < static_cast<int>(row_to_col.size()); i++) {
        total += cost_matrix(i, row_to_col[i]);
    }
    return total;
}

inline std::vector<int> invert_assignment(const std::vector<int>& row_to_col)
{
    std::vector<int> col_to_row(row_to_col.size(), -1);
    for (int i = 0; i < static_cast<int>(row_to_col.size()); i++) {
        col_to_row[row_to_col[i]] = i;
    }
    return col_to_row;
}

inline bool is_perfect_matching(const std::vector<int>& row_to_col, const std::vector<int>& col_to_row)
{
    const auto n = static_cast<int>(row_to_col.size());
    if (static_cast<int>(col_to_row.size()) != n) {
        return false;
    }
    for (int i = 0; i < n; i++) {
        const auto j = row_to_col[i];
        if (j < 0 || j >= n || col_to_row[j] != i) {
            return false;
        }
    }
    for (int j = 0; j < n; j++) {
        const auto i = col_to_row[j];
        if (i < 0 || i >= n || row_to_col[i] != j) {
            return false;
        }
    }
    return true;
}

}  // namespace lapjv::utils

#endif  // LAPJV_UTILS_HPP
