// clang-format off
#include GENERATED_HEADER_FILE
// clang-format on

#include "aoc23/day.hpp"
#include "aoc23/file.hpp"
#include "aoc23/logging.hpp"
#include "aoc23/preprocessor.hpp"

#include <benchmark/benchmark.h>
#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <filesystem>
#include <utility>

namespace {

  using namespace aoc23;

  template <size_t Day, size_t Part, size_t Version = static_cast<size_t>(-1)>
  void benchmark_day_part(benchmark::State & state) {
    auto const input_path = input_file_path(AOC23_STRINGIFY(INPUT_DIR), Day, Part);

    // Skip benchmarks for which no input files exist.
    if (!std::filesystem::exists(input_path)) {
      state.SkipWithError(fmt::format("Input file does not exist ({})", input_path).c_str());
      return;
    }

    // Suppress all non-critical logging inside solvers. Logging can't be disabled completely,
    // since each day is compiled into a separate library with its own SPDLOG_ACTIVE_LEVEL.
    auto const prev_log_level = spdlog::get_level();
    spdlog::set_level(spdlog::level::warn);

    try {
      auto const input = read_file(input_path);

      for (auto _ : state) {
        // Internal state might change when calling solve, so always recreate the day_t object.
        day_t<Day> day{};
        static constexpr auto tag = part<Part>;

        if constexpr (Version == static_cast<size_t>(-1)) {
          benchmark::DoNotOptimize(day.solve(tag, input));
        } else {
          benchmark::DoNotOptimize(day.solve(tag, version<Version>, input));
        }
      }

      state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * input.size()));
    } catch (std::exception const & ex) {
      state.SkipWithError(fmt::format("Exception: {}", ex.what()).c_str());
    }

    spdlog::set_level(prev_log_level);
  }

  template <size_t Day, size_t Part, bool IsMultiDayBenchmark>
  void register_day_part() {
    using input_t = decltype(read_file(std::declval<std::filesystem::path>()));
    using info_t = version_info_t<Day, Part, input_t>;

    auto const msg_prefix = log_prefix(Day, Part);

    // When benchmarking several days, only run the highest version of each part. Otherwise run
    // all available versions so they can be compared.
    if constexpr (!IsMultiDayBenchmark && info_t::has_versions) {
      static constexpr auto versions = std::make_index_sequence<info_t::num_versions>{};

      auto const invoker = [&]<size_t... Version>(std::index_sequence<Version...>) {
        (..., benchmark::RegisterBenchmark(fmt::format("{} v{:d}", msg_prefix, Version).c_str(),
                                           &benchmark_day_part<Day, Part, Version>));
      };
      invoker(versions);
    } else if constexpr (info_t::has_versions) {
      benchmark::RegisterBenchmark(msg_prefix.c_str(),
                                   &benchmark_day_part<Day, Part, info_t::highest_version>);
    } else if constexpr (info_t::can_run) {
      benchmark::RegisterBenchmark(msg_prefix.c_str(), &benchmark_day_part<Day, Part>);
    }
  }

  template <size_t Day, bool IsMultiDayBenchmark>
  void register_day() {
    static constexpr auto parts = std::make_index_sequence<max_parts>{};

    auto const invoker = []<size_t... Part>(std::index_sequence<Part...>) {
      (..., register_day_part<Day, Part + 1, IsMultiDayBenchmark>());
    };
    invoker(parts);
  }

  template <size_t... Days>
  void register_days() {
    static constexpr bool is_multi_day_benchmark = sizeof...(Days) > 1;
    (..., register_day<Days, is_multi_day_benchmark>());
  }

}  // namespace

int main(int argc, char ** argv) {
  aoc23::setup_logging(argc, argv);

  benchmark::Initialize(&argc, argv);
  register_days<DAY_NUMBERS>();

  benchmark::RunSpecifiedBenchmarks();
  benchmark::Shutdown();
}
