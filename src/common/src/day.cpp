#include "aoc23/day.hpp"

#include "aoc23/file.hpp"
#include "aoc23/string.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <algorithm>
#include <iterator>
#include <ranges>
#include <regex>

namespace aoc23 {

  std::filesystem::path input_file_path(std::filesystem::path input_dir, size_t day, size_t part) {
    return std::move(input_dir) / fmt::format("day_{:02d}-part_{}.txt", day, part);
  }

  std::filesystem::path solution_file_path(std::filesystem::path const & example_file) {
    return example_file.parent_path() /
           example_file.stem().concat("-solution").concat(example_file.extension().native());
  }

  size_t example_number(std::filesystem::path const & example_file) {
    auto const & stem = example_file.stem().native();
    return to_int<size_t>(std::string_view{stem}.substr(stem.find_last_of('_') + 1));
  }

  std::vector<std::filesystem::path> example_file_paths(std::filesystem::path const & dir,
                                                        size_t day,
                                                        size_t part) {
    auto const pattern =
        std::regex(fmt::format(R"(^day_{:02d}-part_{:d}-example_\d+\.txt$)", day, part));

    // Compiler error if entries is not a separate variable.
    auto entries = std::filesystem::directory_iterator(dir);
    auto matches = entries | std::views::filter([](auto const & e) {
                     return std::filesystem::is_regular_file(resolve_symlink(e.path()));
                   }) |
                   std::views::filter([&](auto const & e) {
                     return std::regex_match(e.path().filename().native(), pattern);
                   }) |
                   std::views::filter([](auto const & e) {
                     return std::filesystem::exists(solution_file_path(e.path()));
                   }) |
                   std::views::transform([](auto const & e) { return e.path(); });

    std::vector<std::filesystem::path> result;
    std::ranges::copy(matches, std::back_inserter(result));

    // Sort by example number, so example_10 comes after example_9.
    std::ranges::sort(result, {}, [](auto const & path) { return example_number(path); });

    return result;
  }

}  // namespace aoc23
