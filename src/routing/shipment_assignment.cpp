#include "lapjv/routing/shipment_assignment.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <range/v3/all.hpp>

#include "lapjv/fmt.hpp"

namespace rngv = ranges::views;

namespace lapjv::routing
{

Eigen::MatrixXd reward_matrix(const std::vector<std::string>& drivers, const std::vector<std::string>& addresses,
                              const ScoringParameters& params)
{
    Eigen::MatrixXd rewards(static_cast<Eigen::Index>(drivers.size()), static_cast<Eigen::Index>(addresses.size()));
    for (auto&& [row, driver] : drivers | rngv::enumerate) {
        for (auto&& [col, address] : addresses | rngv::enumerate) {
            rewards(row, col) = suitability_score(driver, address, params);
        }
    }
    return rewards;
}

Eigen::MatrixXd cost_matrix(const Eigen::Ref<const Eigen::MatrixXd>& rewards, const ScoringParameters& params)
{
    const auto n = std::max(rewards.rows(), rewards.cols());
    Eigen::MatrixXd costs = Eigen::MatrixXd::Constant(n, n, params.unsuitable_cost);
    costs.topLeftCorner(rewards.rows(), rewards.cols()) =
        (rewards.array() == 0.0).select(params.unsuitable_cost, -rewards.array()).matrix();
    return costs;
}

RoutingPlan assign_shipments(const std::vector<std::string>& drivers, const std::vector<std::string>& addresses,
                             const assignment_solvers::IAssignmentSolver& solver, const ScoringParameters& params)
{
    const auto num_drivers = static_cast<int>(drivers.size());
    const auto num_addresses = static_cast<int>(addresses.size());

    RoutingPlan plan{};

    if (num_drivers == 0 || num_addresses == 0) {
        spdlog::warn("Nothing to assign with {} drivers and {} addresses", num_drivers, num_addresses);
        plan.idle_drivers = drivers;
        plan.unserved_addresses = addresses;
        return plan;
    }

    const auto rewards = reward_matrix(drivers, addresses, params);
    const auto costs = cost_matrix(rewards, params);
    spdlog::debug("Reward matrix:\n{}", rewards);
    spdlog::debug("Cost matrix:\n{}", costs);

    const auto solution = solver.solve(costs);

    for (int i = 0; i < num_drivers; i++) {
        const auto j = solution.row_to_col[i];
        if (j >= num_addresses) {
            plan.idle_drivers.push_back(drivers[i]);
            continue;
        }
        plan.assignments.push_back(ShipmentAssignment{drivers[i], addresses[j], rewards(i, j)});
        plan.total_score += rewards(i, j);
    }
    for (int j = 0; j < num_addresses; j++) {
        if (solution.col_to_row[j] >= num_drivers) {
            plan.unserved_addresses.push_back(addresses[j]);
        }
    }

    spdlog::debug("Assigned {} shipments with total score {}", plan.assignments.size(), plan.total_score);
    return plan;
}

}  // namespace lapjv::routing
