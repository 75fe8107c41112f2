#pragma once

#include <functional>
#include <iterator>
#include <ranges>

namespace aoc23 {

  /** A branchless implementation of a lower bound binary search.
   *
   * Returns the first element `e` for which `compare(e, needle)` is false. The range must be
   * partitioned with respect to that predicate.
   */
  template <std::ranges::forward_range R, class T, class Compare = std::less<>>
  std::ranges::borrowed_iterator_t<R> lower_bound(R && haystack,
                                                  T const & needle,
                                                  Compare compare = Compare{});

  template <std::forward_iterator I, std::sentinel_for<I> S, class T, class Compare = std::less<>>
  I lower_bound(I first, S last, T const & needle, Compare compare = Compare{});

}  // namespace aoc23

#include "aoc23/algorithm.tpp"
