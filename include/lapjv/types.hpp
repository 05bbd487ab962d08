#ifndef LAPJV_TYPES_HPP
#define LAPJV_TYPES_HPP

#include <Eigen/Core>
#include <vector>

namespace lapjv::types
{

struct Solution
{
    double cost{};
    std::vector<int> row_to_col{};
    std::vector<int> col_to_row{};

    // Row and column duals. Empty when the solver does not produce them.
    Eigen::VectorXd u{};
    Eigen::VectorXd v{};

    int size() const
    {
        return static_cast<int>(row_to_col.size());
    }

    bool has_duals() const
    {
        return u.size() > 0 && v.size() > 0;
    }
};

}  // namespace lapjv::types

#endif  // LAPJV_TYPES_HPP
