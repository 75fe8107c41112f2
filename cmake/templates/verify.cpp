// clang-format off
#include GENERATED_HEADER_FILE
// clang-format on

#include "aoc23/day.hpp"
#include "aoc23/file.hpp"
#include "aoc23/logging.hpp"
#include "aoc23/preprocessor.hpp"
#include "aoc23/string.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace {

  using namespace aoc23;

  struct test_count_t {
    test_count_t & operator+=(test_count_t const & other) {
      successful += other.successful;
      total += other.total;
      return *this;
    }

    unsigned successful = 0;
    unsigned total = 0;
  };

  auto styled_verdict(bool success) {
    return success ? fmt::styled("PASS", fmt::fg(fmt::terminal_color::green))
                   : fmt::styled("FAIL", fmt::fg(fmt::terminal_color::red));
  }

  template <size_t Day, size_t Part, size_t Version, class StringLike>
  bool verify_day_part_version(std::string_view msg_prefix,
                               StringLike const & input,
                               size_t example,
                               std::string_view expected) {
    static constexpr bool run_version = Version != static_cast<size_t>(-1);
    auto const version_suffix = run_version ? fmt::format(" v{:d}", Version) : std::string{};

    std::string actual;
    try {
      // Internal state might change when calling solve, so always recreate the day_t object.
      day_t<Day> day{};
      static constexpr auto tag = part<Part>;

      if constexpr (run_version) {
        actual = fmt::format("{}", day.solve(tag, version<Version>, input));
      } else {
        actual = fmt::format("{}", day.solve(tag, input));
      }
    } catch (std::exception const & ex) {
      spdlog::error("[{}{} - example {}] {} (exception: {})", msg_prefix, version_suffix, example,
                    styled_verdict(false), ex.what());
      return false;
    }

    bool const success = actual == expected;
    spdlog::info("[{}{} - example {}] {} (actual: {}, expected: {})", msg_prefix, version_suffix,
                 example, styled_verdict(success), actual, expected);
    return success;
  }

  template <size_t Day, size_t Part>
  test_count_t verify_day_part(std::filesystem::path const & input_dir) {
    using input_t = decltype(read_file(std::declval<std::filesystem::path>()));
    using info_t = version_info_t<Day, Part, input_t>;

    test_count_t test_count;

    if constexpr (info_t::can_run) {
      auto const msg_prefix = log_prefix(Day, Part);
      auto const example_files = example_file_paths(input_dir, Day, Part);

      if (example_files.empty()) {
        spdlog::warn("[{}] No example files found", msg_prefix);
        return test_count;
      }

      // Validate each example file for each version. Iterate over example files first, since
      // this makes it easier to compare the output of different versions against each other.
      for (auto const & example_file : example_files) {
        auto const expected = trim(read_file(solution_file_path(example_file)));
        auto const example = example_number(example_file);
        auto const input = read_file(example_file);

        if constexpr (info_t::has_versions) {
          static constexpr auto versions = std::make_index_sequence<info_t::num_versions>{};

          auto const invoker = [&]<size_t... Version>(std::index_sequence<Version...>) {
            unsigned successful = 0;
            ((successful += verify_day_part_version<Day, Part, Version>(msg_prefix, input, example,
                                                                        expected)),
             ...);
            return successful;
          };

          test_count.total += info_t::num_versions;
          test_count.successful += invoker(versions);
        } else {
          test_count.total += 1;
          test_count.successful += verify_day_part_version<Day, Part, static_cast<size_t>(-1)>(
              msg_prefix, input, example, expected);
        }
      }
    }

    return test_count;
  }

  template <size_t Day>
  test_count_t verify_day(std::filesystem::path const & input_dir) {
    static constexpr auto parts = std::make_index_sequence<max_parts>{};

    auto const invoker = [&]<size_t... Part>(std::index_sequence<Part...>) {
      test_count_t result{};
      ((result += verify_day_part<Day, Part + 1>(input_dir)), ...);
      return result;
    };
    return invoker(parts);
  }

  template <size_t... Days>
  test_count_t verify_days(std::filesystem::path const & input_dir) {
    test_count_t result{};
    ((result += verify_day<Days>(input_dir)), ...);
    return result;
  }

}  // namespace

int main(int argc, char ** argv) {
  aoc23::setup_logging(argc, argv);

  auto const test_counts = verify_days<DAY_NUMBERS>(AOC23_STRINGIFY(INPUT_DIR));
  bool const success = (test_counts.total > 0) && (test_counts.total == test_counts.successful);

  spdlog::info("[summary] {} ({} passed, {} failed, {} total)", styled_verdict(success),
               test_counts.successful, test_counts.total - test_counts.successful,
               test_counts.total);
  return success ? 0 : 1;
}
