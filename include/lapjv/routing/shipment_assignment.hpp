#ifndef LAPJV_ROUTING_SHIPMENT_ASSIGNMENT_HPP
#define LAPJV_ROUTING_SHIPMENT_ASSIGNMENT_HPP

#include <Eigen/Core>
#include <string>
#include <vector>

#include "lapjv/assignment_solvers/assignment_solver_interface.hpp"
#include "lapjv/routing/suitability.hpp"

namespace lapjv::routing
{

struct ShipmentAssignment
{
    std::string driver{};
    std::string address{};
    double score{};
};

struct RoutingPlan
{
    double total_score{};
    std::vector<ShipmentAssignment> assignments{};

    // Left over when there are more drivers than addresses or the other way around
    std::vector<std::string> idle_drivers{};
    std::vector<std::string> unserved_addresses{};
};

// Suitability scores, one row per driver and one column per address
Eigen::MatrixXd reward_matrix(const std::vector<std::string>& drivers, const std::vector<std::string>& addresses,
                              const ScoringParameters& params);

// Negated rewards, with zero rewards replaced by params.unsuitable_cost and padded square with the same value
Eigen::MatrixXd cost_matrix(const Eigen::Ref<const Eigen::MatrixXd>& rewards, const ScoringParameters& params);

RoutingPlan assign_shipments(const std::vector<std::string>& drivers, const std::vector<std::string>& addresses,
                             const assignment_solvers::IAssignmentSolver& solver, const ScoringParameters& params);

}  // namespace lapjv::routing

#endif  // LAPJV_ROUTING_SHIPMENT_ASSIGNMENT_HPP
