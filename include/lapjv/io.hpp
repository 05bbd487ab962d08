#ifndef LAPJV_IO_HPP
#define LAPJV_IO_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace lapjv::io
{

// One entry per non-blank line, with trailing carriage returns removed
std::vector<std::string> read_lines(const std::filesystem::path& path);

}  // namespace lapjv::io

#endif  // LAPJV_IO_HPP
