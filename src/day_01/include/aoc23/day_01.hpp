#pragma once

#include "aoc23/day.hpp"
#include "aoc23/simd.hpp"

#include <cstdint>

/*
 * Trebuchet?!: each line's calibration value is its first digit followed by its last digit. In
 * part 2 digits may also be spelled out ("one" to "nine"), and spelled digits may overlap.
 */

namespace aoc23 {

  template <>
  struct day_t<1> {
    uint32_t solve(part_t<1>, simd_string_view_t input);
    uint32_t solve(part_t<2>, simd_string_view_t input);
  };

}  // namespace aoc23
