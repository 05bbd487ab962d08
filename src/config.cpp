#include "lapjv/config.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <magic_enum.hpp>
#include <stdexcept>

namespace lapjv::config
{

Config::Config(const char* filename)
{
    const auto yaml = YAML::LoadFile(filename);

    // Assignment

    if (const auto assignment_yaml = yaml["assignment"]) {
        if (const auto solver_yaml = assignment_yaml["solver"]) {
            const auto solver_name = solver_yaml.as<std::string>();
            const auto solver =
                magic_enum::enum_cast<assignment_solvers::AssignmentSolver>(solver_name, magic_enum::case_insensitive);
            if (!solver) {
                throw std::invalid_argument(fmt::format("Unknown assignment solver '{}'", solver_name));
            }
            assignment_solver = *solver;
        }

        if (const auto auction_yaml = assignment_yaml["auction"]) {
            auction.epsilon = auction_yaml["epsilon"].as<double>(auction.epsilon);
            auction.max_iterations = auction_yaml["max_iterations"].as<uint64_t>(auction.max_iterations);
        }
    }

    // Scoring

    if (const auto scoring_yaml = yaml["scoring"]) {
        scoring.even_multiplier = scoring_yaml["even_multiplier"].as<double>(scoring.even_multiplier);
        scoring.odd_multiplier = scoring_yaml["odd_multiplier"].as<double>(scoring.odd_multiplier);
        scoring.common_factor_bonus = scoring_yaml["common_factor_bonus"].as<double>(scoring.common_factor_bonus);
        scoring.unsuitable_cost = scoring_yaml["unsuitable_cost"].as<double>(scoring.unsuitable_cost);
    }

    // Logging

    if (const auto logging_yaml = yaml["logging"]) {
        if (const auto level_yaml = logging_yaml["level"]) {
            const auto level_name = level_yaml.as<std::string>();
            log_level = spdlog::level::from_str(level_name);
            if (log_level == spdlog::level::off && level_name != "off") {
                throw std::invalid_argument(fmt::format("Unknown log level '{}'", level_name));
            }
        }
    }
}

}  // namespace lapjv::config
