#include "lapjv/lap.hpp"

#include "lapjv/assignment_solvers/jonker_volgenant.hpp"
#include "lapjv/validation.hpp"

namespace lapjv
{

types::Solution lap(const int dim, const std::vector<std::vector<double>>& cost_matrix)
{
    const auto costs = validation::to_cost_matrix(dim, cost_matrix);
    const assignment_solvers::JonkerVolgenant solver{};
    return solver.solve(costs);
}

}  // namespace lapjv
