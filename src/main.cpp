#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <magic_enum.hpp>
#include <memory>

#include "lapjv/argparse.hpp"
#include "lapjv/assignment_solvers/auction.hpp"
#include "lapjv/assignment_solvers/brute_force.hpp"
#include "lapjv/assignment_solvers/jonker_volgenant.hpp"
#include "lapjv/config.hpp"
#include "lapjv/io.hpp"
#include "lapjv/routing/shipment_assignment.hpp"

namespace fs = std::filesystem;

int main(const int argc, const char* argv[])
{
    try {
        const auto [addresses_path, drivers_path, config_path] = lapjv::argparse::parse_args(argc, argv);

        const auto conf = lapjv::config::Config{fs::path{config_path}};
        spdlog::set_level(conf.log_level);

        spdlog::info("Using assignment solver {}", magic_enum::enum_name(conf.assignment_solver));

        std::unique_ptr<lapjv::assignment_solvers::IAssignmentSolver> assignment_solver{};
        using namespace lapjv::assignment_solvers;
        switch (conf.assignment_solver) {
            case AssignmentSolver::JONKER_VOLGENANT:
            {
                assignment_solver = std::make_unique<JonkerVolgenant>();
                break;
            }
            case AssignmentSolver::AUCTION:
            {
                assignment_solver = std::make_unique<Auction>(conf.auction);
                break;
            }
            case AssignmentSolver::BRUTE_FORCE:
            {
                assignment_solver = std::make_unique<BruteForce>();
                break;
            }
        }

        const auto addresses = lapjv::io::read_lines(addresses_path);
        const auto drivers = lapjv::io::read_lines(drivers_path);
        spdlog::info("Assigning {} drivers to {} addresses", drivers.size(), addresses.size());

        const auto plan = lapjv::routing::assign_shipments(drivers, addresses, *assignment_solver, conf.scoring);

        fmt::print("total score: {}\n", plan.total_score);
        fmt::print("assignments:\n");
        for (const auto& assignment : plan.assignments) {
            fmt::print("\tDriver: {}\n", assignment.driver);
            fmt::print("\tDestination: {}\n\n", assignment.address);
        }
        for (const auto& driver : plan.idle_drivers) {
            fmt::print("idle driver: {}\n", driver);
        }
        for (const auto& address : plan.unserved_addresses) {
            fmt::print("unserved destination: {}\n", address);
        }
    }
    catch (const std::exception& err) {
        spdlog::error("{}", err.what());
        return 1;
    }

    return 0;
}
