#ifndef LAPJV_ASSIGNMENT_SOLVERS_ASSIGNMENT_SOLVER_INTERFACE_HPP
#define LAPJV_ASSIGNMENT_SOLVERS_ASSIGNMENT_SOLVER_INTERFACE_HPP

#include <Eigen/Core>
#include <cstdint>

#include "lapjv/types.hpp"

namespace lapjv::assignment_solvers
{

enum class AssignmentSolver : uint8_t {
    JONKER_VOLGENANT = 0,
    AUCTION = 1,
    BRUTE_FORCE = 2,
};

class IAssignmentSolver
{
   public:
    // Minimum cost perfect matching of a square cost matrix
    virtual types::Solution solve(const Eigen::Ref<const Eigen::MatrixXd>& cost_matrix) const = 0;

    virtual ~IAssignmentSolver() = default;
    IAssignmentSolver() = default;
    IAssignmentSolver(const IAssignmentSolver&) = delete;
    IAssignmentSolver(IAssignmentSolver&& rhs) noexcept = delete;
    IAssignmentSolver& operator=(const IAssignmentSolver& rhs) = delete;
    IAssignmentSolver& operator=(IAssignmentSolver&& rhs) noexcept = delete;
};

}  // namespace lapjv::assignment_solvers

#endif  // LAPJV_ASSIGNMENT_SOLVERS_ASSIGNMENT_SOLVER_INTERFACE_HPP
