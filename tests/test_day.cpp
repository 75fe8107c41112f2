#include <catch2/catch.hpp>

#include "aoc23/day.hpp"
#include "aoc23/day_01.hpp"
#include "aoc23/day_02.hpp"
#include "aoc23/day_03.hpp"
#include "aoc23/file.hpp"

#include <filesystem>
#include <utility>

using namespace aoc23;

using input_t = decltype(read_file(std::declval<std::filesystem::path>()));

TEST_CASE("input file names are zero padded", "[day]") {
  REQUIRE(input_file_path("inputs", 3, 1) == std::filesystem::path{"inputs/day_03-part_1.txt"});
  REQUIRE(input_file_path("", 12, 2) == std::filesystem::path{"day_12-part_2.txt"});
}

TEST_CASE("solution file lives next to its example", "[day]") {
  auto const example = std::filesystem::path{"inputs/day_03-part_2-example_1.txt"};
  REQUIRE(solution_file_path(example) ==
          std::filesystem::path{"inputs/day_03-part_2-example_1-solution.txt"});
  REQUIRE(example_number(example) == 1);
  REQUIRE(example_number("day_01-part_1-example_12.txt") == 12);
}

TEST_CASE("example files are found and sorted", "[day]") {
  auto const examples = example_file_paths(AOC23_INPUT_DIR, 3, 1);

  REQUIRE(examples.size() == 2);
  REQUIRE(examples[0].filename() == "day_03-part_1-example_1.txt");
  REQUIRE(examples[1].filename() == "day_03-part_1-example_2.txt");
}

TEST_CASE("days without examples yield no files", "[day]") {
  REQUIRE(example_file_paths(AOC23_INPUT_DIR, 25, 1).empty());
}

TEST_CASE("versions are detected per part", "[day]") {
  using day_03_part_1 = version_info_t<3, 1, input_t>;
  STATIC_REQUIRE(day_03_part_1::has_versions);
  STATIC_REQUIRE(day_03_part_1::num_versions == 2);
  STATIC_REQUIRE(day_03_part_1::highest_version == 1);
  STATIC_REQUIRE(day_03_part_1::can_run);

  using day_01_part_2 = version_info_t<1, 2, input_t>;
  STATIC_REQUIRE_FALSE(day_01_part_2::has_versions);
  STATIC_REQUIRE(day_01_part_2::can_run);

  STATIC_REQUIRE(invocable_for_part<2, 1, input_t>);
  STATIC_REQUIRE_FALSE(invocable_for_part<3, 1, input_t>);
}
