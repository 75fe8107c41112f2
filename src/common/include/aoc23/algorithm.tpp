#pragma once

#include "aoc23/algorithm.hpp"  // Only for IDE.

#include <cstddef>
#include <utility>

namespace aoc23 {

  template <std::forward_iterator I, std::sentinel_for<I> S, class T, class Compare>
  I lower_bound(I first, S last, T const & needle, Compare compare) {
    size_t length = std::ranges::distance(first, last);

    while (length > 0) {
      size_t const half = length / 2;
      bool const go_right = compare(*std::next(first, half), needle);
      std::advance(first, go_right * (length - half));
      length = half;
    }

    return first;
  }

  template <std::ranges::forward_range R, class T, class Compare>
  std::ranges::borrowed_iterator_t<R> lower_bound(R && haystack,
                                                  T const & needle,
                                                  Compare compare) {
    return aoc23::lower_bound(std::ranges::begin(haystack), std::ranges::end(haystack), needle,
                              std::move(compare));
  }

}  // namespace aoc23
