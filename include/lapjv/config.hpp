#ifndef LAPJV_CONFIG_HPP
#define LAPJV_CONFIG_HPP

#include <spdlog/common.h>

#include <filesystem>
#include <string>

#include "lapjv/assignment_solvers/assignment_solver_interface.hpp"
#include "lapjv/assignment_solvers/auction.hpp"
#include "lapjv/routing/suitability.hpp"

namespace lapjv::config
{

struct Config
{
    Config() = default;
    explicit Config(const char* filename);
    explicit Config(const std::string& filename) : Config(filename.c_str())
    {
    }
    explicit Config(const std::filesystem::path& filename) : Config(filename.string())
    {
    }

    assignment_solvers::AssignmentSolver assignment_solver{assignment_solvers::AssignmentSolver::JONKER_VOLGENANT};
    assignment_solvers::AuctionParameters auction{};

    routing::ScoringParameters scoring{};

    spdlog::level::level_enum log_level{spdlog::level::info};
};

}  // namespace lapjv::config

#endif  // LAPJV_CONFIG_HPP
