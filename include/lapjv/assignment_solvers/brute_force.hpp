#ifndef LAPJV_ASSIGNMENT_SOLVERS_BRUTE_FORCE_HPP
#define LAPJV_ASSIGNMENT_SOLVERS_BRUTE_FORCE_HPP

#include "lapjv/assignment_solvers/assignment_solver_interface.hpp"

namespace lapjv::assignment_solvers
{

// Enumerates all n! assignments. Does not produce duals.
class BruteForce final : public IAssignmentSolver
{
   public:
    static constexpr int MAX_DIMENSION = 8;

    types::Solution solve(const Eigen::Ref<const Eigen::MatrixXd>& cost_matrix) const override;
};

}  // namespace lapjv::assignment_solvers

#endif  // LAPJV_ASSIGNMENT_SOLVERS_BRUTE_FORCE_HPP
