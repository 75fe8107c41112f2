#pragma once

#include "aoc23/day.hpp"
#include "aoc23/simd.hpp"

#include <cstdint>

/*
 * Gear Ratios: sum of all numbers touching a symbol in an engine schematic (part 1), and sum of
 * the products of number pairs touching a '*' (part 2).
 *
 * Version 0 streams over the lines, keeping two lines of components in memory. Version 1 parses
 * the whole schematic first and then checks every component's neighborhood directly.
 */

namespace aoc23 {

  template <>
  struct day_t<3> {
    uint64_t solve(part_t<1>, version_t<0>, simd_string_view_t input);
    uint64_t solve(part_t<1>, version_t<1>, simd_string_view_t input);

    uint64_t solve(part_t<2>, version_t<0>, simd_string_view_t input);
    uint64_t solve(part_t<2>, version_t<1>, simd_string_view_t input);
  };

}  // namespace aoc23
