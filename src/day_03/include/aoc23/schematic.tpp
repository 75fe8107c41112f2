#pragma once

#include "aoc23/schematic.hpp"  // Only for IDE.

#include "aoc23/algorithm.hpp"

#include <algorithm>

namespace aoc23::schematic {

  template <class Fn>
  void schematic_t::for_each_neighbor(component_t const & component, Fn && fn) const {
    if (lines_.empty()) {
      return;
    }

    size_t const first_line = (component.line == 0) ? 0 : component.line - 1;
    size_t const last_line = std::min(component.line + 1, lines_.size() - 1);

    for (size_t line_idx = first_line; line_idx <= last_line; ++line_idx) {
      auto const & candidates = lines_[line_idx];

      // Components are sorted by column and never overlap, so skip everything that ends left of
      // the footprint, then walk until the first component starting right of it.
      auto it = aoc23::lower_bound(candidates, component.column,
                                   [](component_t const & candidate, size_t column) {
                                     return candidate.end_column() < column;
                                   });

      for (; (it != candidates.end()) && (it->column <= component.end_column()); ++it) {
        if (component.touches(*it)) {
          fn(*it);
        }
      }
    }
  }

}  // namespace aoc23::schematic
