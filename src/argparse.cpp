#include "lapjv/argparse.hpp"

namespace lapjv::argparse
{

constexpr auto PROGRAM_NAME = "lapjv_assign";
constexpr auto DEFAULT_CONFIG_PATH = "config/config.yaml";

ParsedArgs parse_args(const int argc, const char* argv[])
{
    ::argparse::ArgumentParser argparser{PROGRAM_NAME};

    argparser.add_argument("addresses_path").help("Path to file with one shipment destination address per line.");

    argparser.add_argument("drivers_path").help("Path to file with one driver name per line.");

    argparser
        .add_argument("--config")                                   //
        .help("Path to YAML configuration of solver and scoring.")  //
        .default_value(std::string{DEFAULT_CONFIG_PATH});

    argparser.parse_args(argc, argv);

    return ParsedArgs{argparser.get<std::string>("addresses_path"), argparser.get<std::string>("drivers_path"),
                      argparser.get<std::string>("--config")};
}

}  // namespace lapjv::argparse
