#ifndef LAPJV_ASSIGNMENT_SOLVERS_JONKER_VOLGENANT_HPP
#define LAPJV_ASSIGNMENT_SOLVERS_JONKER_VOLGENANT_HPP

#include "lapjv/assignment_solvers/assignment_solver_interface.hpp"

namespace lapjv::assignment_solvers
{

/**
 * Tie-break tolerance and "infinite" reduced cost used by the Jonker-Volgenant phases.
 *
 * Both scale with the average row magnitude of the cost matrix, and both are zero for an all-zero matrix, in which
 * case ties are broken by exact floating point comparison.
 */
struct ScaleConstants
{
    static constexpr double SCALE_FACTOR = 10'000.0;

    double big{};
    double epsilon{};
};

ScaleConstants estimate_scale(const Eigen::Ref<const Eigen::MatrixXd>& cost_matrix);

/**
 * Shortest augmenting path solver of Jonker and Volgenant, "A Shortest Augmenting Path Algorithm for Dense and
 * Sparse Linear Assignment Problems", Computing 38, 325-340, 1987.
 *
 * Column reduction, reduction transfer and two passes of augmenting row reduction build a partial assignment and
 * column duals, then every remaining free row is assigned through a Dijkstra-like search over reduced costs.
 */
class JonkerVolgenant final : public IAssignmentSolver
{
   public:
    types::Solution solve(const Eigen::Ref<const Eigen::MatrixXd>& cost_matrix) const override;
};

}  // namespace lapjv::assignment_solvers

#endif  // LAPJV_ASSIGNMENT_SOLVERS_JONKER_VOLGENANT_HPP
