#ifndef LAPJV_LAP_HPP
#define LAPJV_LAP_HPP

#include <vector>

#include "lapjv/types.hpp"

namespace lapjv
{

/**
 * Solves the dim x dim linear assignment problem with the Jonker-Volgenant shortest augmenting path algorithm.
 *
 * Throws InvalidDimension if dim <= 0 or the matrix is not dim x dim, NonFiniteCost if any entry is NaN or infinite.
 */
types::Solution lap(const int dim, const std::vector<std::vector<double>>& cost_matrix);

}  // namespace lapjv

#endif  // LAPJV_LAP_HPP
