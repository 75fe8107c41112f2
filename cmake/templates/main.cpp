// clang-format off
#include GENERATED_HEADER_FILE
// clang-format on

#include "aoc23/day.hpp"
#include "aoc23/file.hpp"
#include "aoc23/logging.hpp"
#include "aoc23/preprocessor.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <filesystem>
#include <string_view>
#include <utility>

namespace {

  using namespace aoc23;

  /// Returns false if solving the part failed.
  template <size_t Day, size_t Part>
  bool run_day_part(std::filesystem::path const & input_dir) {
    using input_t = decltype(read_file(std::declval<std::filesystem::path>()));
    using info_t = version_info_t<Day, Part, input_t>;

    if constexpr (info_t::can_run) {
      auto const msg_prefix = fmt::format("[{}]", log_prefix(Day, Part));

      auto const input_path = input_file_path(input_dir, Day, Part);
      if (!std::filesystem::exists(input_path)) {  // Skip part if file doesn't exist.
        spdlog::warn("{} Input file does not exist ({})", msg_prefix, input_path);
        return true;
      }

      try {
        day_t<Day> day{};
        static constexpr auto tag = part<Part>;

        auto const input = read_file(input_path);
        auto const result = [&] {  // Only run the highest version.
          if constexpr (info_t::has_versions) {
            return day.solve(tag, version<info_t::highest_version>, input);
          } else {
            return day.solve(tag, input);
          }
        }();
        spdlog::info("{} {}", msg_prefix, result);
      } catch (std::exception const & ex) {
        spdlog::error("{} Failed: {}", msg_prefix, ex.what());
        return false;
      }
    }

    return true;
  }

  template <size_t Day>
  bool run_day(std::filesystem::path const & input_dir) {
    static constexpr auto parts = std::make_index_sequence<max_parts>{};

    auto const invoker = [&]<size_t... Part>(std::index_sequence<Part...>) {
      // Comma fold to run the parts in order, and to run every part even if an earlier one failed.
      bool success = true;
      ((success &= run_day_part<Day, Part + 1>(input_dir)), ...);
      return success;
    };
    return invoker(parts);
  }

  template <size_t... Days>
  bool run_days(std::filesystem::path const & input_dir) {
    bool success = true;
    ((success &= run_day<Days>(input_dir)), ...);
    return success;
  }

  /// The first argument that isn't a logging setting overrides the input directory.
  std::filesystem::path find_input_dir(int argc, char ** argv) {
    for (int idx = 1; idx < argc; ++idx) {
      auto const arg = std::string_view{argv[idx]};
      if (!arg.starts_with("SPDLOG_LEVEL=")) {
        return std::filesystem::path{arg};
      }
    }

    return AOC23_STRINGIFY(INPUT_DIR);
  }

}  // namespace

int main(int argc, char ** argv) {
  aoc23::setup_logging(argc, argv);

  auto const input_dir = find_input_dir(argc, argv);
  spdlog::debug("Reading inputs from {}", input_dir);

  return run_days<DAY_NUMBERS>(input_dir) ? 0 : 1;
}
