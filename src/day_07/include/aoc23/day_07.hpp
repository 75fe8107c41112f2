#pragma once

#include "aoc23/day.hpp"
#include "aoc23/simd.hpp"

#include <cstdint>

/*
 * Camel Cards: each line holds a hand of five cards and a bid. Hands are ranked by type (five of a
 * kind down to high card), then card by card. The answer is the sum of bid * rank. In part 2 'J'
 * is a joker: it takes whatever label gives the strongest type, but is the weakest card when
 * breaking ties.
 */

namespace aoc23 {

  template <>
  struct day_t<7> {
    uint64_t solve(part_t<1>, simd_string_view_t input);
    uint64_t solve(part_t<2>, simd_string_view_t input);
  };

}  // namespace aoc23
