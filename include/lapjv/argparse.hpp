#ifndef LAPJV_ARGPARSE_HPP
#define LAPJV_ARGPARSE_HPP

#include <argparse/argparse.hpp>
#include <string>

namespace lapjv::argparse
{

struct ParsedArgs
{
    std::string addresses_path{};
    std::string drivers_path{};
    std::string config_path{};
};

ParsedArgs parse_args(const int argc, const char* argv[]);

}  // namespace lapjv::argparse

#endif  // LAPJV_ARGPARSE_HPP
