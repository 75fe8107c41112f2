#include "aoc23/day_03.hpp"

#include "aoc23/schematic.hpp"

#include <spdlog/spdlog.h>

namespace aoc23 {

  uint64_t day_t<3>::solve(part_t<1>, version_t<0>, simd_string_view_t input) {
    return schematic::stream_part_numbers(input);
  }

  uint64_t day_t<3>::solve(part_t<1>, version_t<1>, simd_string_view_t input) {
    auto const schematic = schematic::schematic_t(input);
    SPDLOG_DEBUG("Parsed schematic with {} lines", schematic.num_lines());
    return schematic.sum_part_numbers();
  }

  uint64_t day_t<3>::solve(part_t<2>, version_t<0>, simd_string_view_t input) {
    return schematic::stream_gear_ratios(input);
  }

  uint64_t day_t<3>::solve(part_t<2>, version_t<1>, simd_string_view_t input) {
    auto const schematic = schematic::schematic_t(input);
    SPDLOG_DEBUG("Parsed schematic with {} lines", schematic.num_lines());
    return schematic.sum_gear_ratios();
  }

}  // namespace aoc23
