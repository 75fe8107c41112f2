#pragma once

#include "aoc23/day.hpp"
#include "aoc23/simd.hpp"

#include <cstdint>

/*
 * Cube Conundrum: each line is a game "Game <id>: <draw>; <draw>; ...", where a draw lists
 * "<count> <colour>" pairs separated by commas. Part 1 sums the ids of games possible with 12 red,
 * 13 green and 14 blue cubes. Part 2 sums the product of the minimal cube counts of each game.
 */

namespace aoc23 {

  template <>
  struct day_t<2> {
    uint32_t solve(part_t<1>, simd_string_view_t input);
    uint64_t solve(part_t<2>, simd_string_view_t input);
  };

}  // namespace aoc23
