#ifndef LAPJV_ASSIGNMENT_SOLVERS_AUCTION_HPP
#define LAPJV_ASSIGNMENT_SOLVERS_AUCTION_HPP

#include "lapjv/assignment_solvers/assignment_solver_interface.hpp"

namespace lapjv::assignment_solvers
{

struct AuctionParameters
{
    static constexpr double DEFAULT_EPSILON = 1e-3;
    static constexpr uint64_t DEFAULT_MAX_ITERATIONS = 100'000;

    double epsilon{};
    uint64_t max_iterations{};

    AuctionParameters();
    AuctionParameters(const double eps, const uint64_t max_iter);
};

// Total cost is within n * epsilon of the optimum.
class Auction final : public IAssignmentSolver
{
   public:
    explicit Auction(const AuctionParameters& params);
    types::Solution solve(const Eigen::Ref<const Eigen::MatrixXd>& cost_matrix) const override;

   private:
    double m_eps{};
    uint64_t m_max_iter{};
};

}  // namespace lapjv::assignment_solvers

#endif  // LAPJV_ASSIGNMENT_SOLVERS_AUCTION_HPP
