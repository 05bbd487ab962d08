#include "lapjv/io.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace lapjv::io
{

std::vector<std::string> read_lines(const std::filesystem::path& path)
{
    std::ifstream file{path};
    if (!file) {
        throw std::runtime_error(fmt::format("Could not open {}", path.string()));
    }

    std::vector<std::string> lines{};
    std::string line{};
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const bool blank = std::all_of(line.begin(), line.end(),
                                       [](const char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
        if (!blank) {
            lines.push_back(line);
        }
    }

    spdlog::debug("Read {} lines from {}", lines.size(), path.string());
    return lines;
}

}  // namespace lapjv::io
