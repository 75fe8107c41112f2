#pragma once

#include <concepts>
#include <cstddef>
#include <filesystem>
#include <type_traits>
#include <vector>

namespace aoc23 {

  /// @brief Template for a day's solutions. Must be specialized for each day.
  template <size_t N>
  struct day_t;

  /// @brief Returns path to input file for given day and part, e.g. "day_03-part_1.txt".
  std::filesystem::path input_file_path(std::filesystem::path dir, size_t day, size_t part);

  /** @brief Returns paths to all example files for given day and part, sorted by name.
   *
   * Example files are named "day_{day:02}-part_{part}-example_{number}.txt". Only examples for
   * which a solution file exists are returned (see solution_file_path()).
   */
  std::vector<std::filesystem::path> example_file_paths(std::filesystem::path const & dir,
                                                        size_t day,
                                                        size_t part);

  /// @brief Returns the path of the file holding the expected answer for an example file.
  std::filesystem::path solution_file_path(std::filesystem::path const & example_file);

  /// @brief Returns the number at the end of an example file's name.
  size_t example_number(std::filesystem::path const & example_file);

  /// @brief Part tag for dispatching to solution part-specific implementations.
  template <size_t N>
  struct part_t : std::integral_constant<size_t, N> {};

  template <size_t N>
  inline constexpr part_t<N> part{};

  /// @brief Version tag for dispatching to different implementations of a part's solution.
  template <size_t N>
  struct version_t : std::integral_constant<size_t, N> {};

  template <size_t N>
  inline constexpr version_t<N> version{};

  /// Whether day_t<Day> solves a part without taking a version tag.
  template <size_t Day, size_t Part, class Input>
  concept invocable_for_part = requires(day_t<Day> t, Input in) {
    { t.solve(part<Part>, in) };
  };

  /// Whether day_t<Day> solves a part with the given version tag.
  template <size_t Day, size_t Part, size_t Version, class Input>
  concept invocable_for_part_version = requires(day_t<Day> t, Input in) {
    { t.solve(part<Part>, version<Version>, in) };
  };

  namespace detail {

    // Versions must be numbered 0, 1, ... without gaps. Counting stops at the first missing one.
    template <size_t Day, size_t Part, class Input, size_t Version = 0>
    constexpr size_t count_versions() {
      if constexpr (invocable_for_part_version<Day, Part, Version, Input>) {
        return count_versions<Day, Part, Input, Version + 1>();
      } else {
        return Version;
      }
    }

  }  // namespace detail

  /// Describes which versions (if any) day_t<Day> provides for a part.
  template <size_t Day, size_t Part, class Input>
  struct version_info_t {
    static constexpr size_t num_versions = detail::count_versions<Day, Part, Input>();
    static constexpr bool has_versions = num_versions > 0;
    static constexpr size_t highest_version = has_versions ? num_versions - 1 : 0;
    static constexpr bool can_run = has_versions || invocable_for_part<Day, Part, Input>;
  };

  /// Parts per day.
  inline constexpr size_t max_parts = 2;

}  // namespace aoc23
