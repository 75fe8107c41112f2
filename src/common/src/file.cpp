#include "aoc23/file.hpp"

#include "aoc23/string.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>

namespace aoc23 {

  simd_string_t read_file(std::filesystem::path const & file) {
    auto ifile = std::ifstream{file, std::ios::binary};
    if (!ifile.is_open()) {
      throw file_read_error(fmt::format("Failed to open file ({})", file));
    }

    auto contents =
        simd_string_t(std::istreambuf_iterator<char>{ifile}, std::istreambuf_iterator<char>{});
    if (ifile.bad()) {
      throw file_read_error(fmt::format("Failed to read file ({})", file));
    }

    // Only line breaks are stripped. Other whitespace may be part of the first or last line.
    auto result = trim_line_breaks(std::move(contents));

    // Ensure the last character is a newline. This makes parsing lines easier (i.e. no need to
    // check for either '\n' or EOF).
    result.push_back('\n');

    SPDLOG_DEBUG("Read {} bytes from {}", result.size(), file);
    return result;
  }

  std::filesystem::path resolve_symlink(std::filesystem::path path) {
    if (!std::filesystem::is_symlink(path)) {
      return path;
    }

    auto target = std::filesystem::read_symlink(path);
    if (target.is_absolute()) {
      path = std::move(target);
    } else {
      path = (path.parent_path() / target).lexically_normal();
    }

    return resolve_symlink(std::move(path));
  }

}  // namespace aoc23
