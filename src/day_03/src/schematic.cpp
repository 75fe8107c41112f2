#include "aoc23/schematic.hpp"

#include "aoc23/check.hpp"
#include "aoc23/string.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <ranges>
#include <utility>

namespace aoc23::schematic {

  namespace {

    run_kind_t classify(char c) {
      if (std::isdigit(static_cast<unsigned char>(c))) {
        return run_kind_t::digits;
      } else if (c == blank) {
        return run_kind_t::blanks;
      } else {
        return run_kind_t::symbol;
      }
    }

    number_t parse_number(std::string_view digits, size_t line_idx, size_t column) {
      try {
        return to_int<number_t>(digits);
      } catch (parse_error const & ex) {
        throw parse_error(fmt::format("Line {}, column {}: {}", line_idx, column, ex.what()));
      }
    }

    /// Calls `fn(idx)` for each component of the line, in the requested order.
    template <class Fn>
    void for_each_in_order(std::span<component_t const> line, scan_order_t order, Fn && fn) {
      auto const visit_if = [&](auto const & predicate) {
        for (size_t idx = 0; idx < line.size(); ++idx) {
          if (predicate(line[idx])) {
            fn(idx);
          }
        }
      };

      auto const is_number = [](component_t const & c) { return c.is_number(); };
      auto const is_symbol = [](component_t const & c) { return c.is_symbol(); };

      switch (order) {
        case scan_order_t::in_order:
          visit_if([](component_t const &) { return true; });
          break;
        case scan_order_t::symbols_first:
          visit_if(is_symbol);
          visit_if(is_number);
          break;
        case scan_order_t::numbers_first:
          visit_if(is_number);
          visit_if(is_symbol);
          break;
      }
    }

    /** Calls `fn(neighbor)` for the components directly left and right of `line[idx]`, if they
     * touch it. Blank runs were dropped, so being next to each other in `line` says nothing about
     * the columns in between.
     */
    template <class Fn>
    void for_each_line_neighbor(std::span<component_t const> line, size_t idx, Fn && fn) {
      if ((idx > 0) && line[idx - 1].touches(line[idx])) {
        fn(line[idx - 1]);
      }

      if ((idx + 1 < line.size()) && line[idx + 1].touches(line[idx])) {
        fn(line[idx + 1]);
      }
    }

  }  // namespace

  bool component_t::touches(component_t const & other) const {
    if (position() == other.position()) {
      return false;
    }

    size_t const line_distance = (line > other.line) ? line - other.line : other.line - line;
    return (line_distance <= 1) && (other.column <= end_column()) && (column <= other.end_column());
  }

  std::vector<run_t> split_runs(std::string_view line) {
    std::vector<run_t> runs;

    auto run_begin = line.begin();
    while (run_begin != line.end()) {
      auto const kind = classify(*run_begin);

      // Symbols are never merged, each one is a run of its own.
      auto const run_end =
          (kind == run_kind_t::symbol)
              ? std::next(run_begin)
              : std::find_if(std::next(run_begin), line.end(),
                             [kind](char c) { return classify(c) != kind; });

      runs.push_back({kind, std::string_view(run_begin, run_end)});
      run_begin = run_end;
    }

    return runs;
  }

  std::vector<component_t> tokenize_line(std::string_view line, size_t line_idx) {
    std::vector<component_t> components;
    size_t column = 0;

    for (auto const & run : split_runs(line)) {
      switch (run.kind) {
        case run_kind_t::digits:
          components.push_back({
              .token = std::variant<number_t, char>{std::in_place_type<number_t>,
                                                    parse_number(run.text, line_idx, column)},
              .line = line_idx,
              .column = column,
              .length = run.text.size(),
          });
          break;
        case run_kind_t::symbol:
          check(run.text.size() == 1, "Symbol '{}' at line {}, column {} is {} characters wide",
                run.text, line_idx, column, run.text.size());
          components.push_back({
              .token = std::variant<number_t, char>{std::in_place_type<char>, run.text.front()},
              .line = line_idx,
              .column = column,
              .length = 1,
          });
          break;
        case run_kind_t::blanks:
          break;
      }

      column += run.text.size();
    }

    SPDLOG_TRACE("Line {}: {}", line_idx, fmt::join(components, ", "));
    return components;
  }

  part_accumulator_t scan_parts(part_accumulator_t accumulator,
                                std::span<component_t const> line,
                                scan_order_t order) {
    auto const & previous = accumulator.previous_line;
    auto & previous_counted = accumulator.previous_counted;
    auto counted = std::vector<uint8_t>(line.size(), 0);

    // A number may touch several symbols, but it is only counted once.
    auto const count = [&](component_t const & number, uint8_t & is_counted) {
      if (!is_counted) {
        SPDLOG_TRACE("Part number: {}", number);
        is_counted = 1;
        accumulator.sum += number.number();
        ++accumulator.num_parts;
      }
    };

    for_each_in_order(line, order, [&](size_t idx) {
      auto const & component = line[idx];

      if (component.is_number()) {
        bool touches_symbol = std::ranges::any_of(previous, [&](component_t const & candidate) {
          return candidate.is_symbol() && candidate.touches(component);
        });

        for_each_line_neighbor(line, idx, [&](component_t const & neighbor) {
          touches_symbol |= neighbor.is_symbol();
        });

        if (touches_symbol) {
          count(component, counted[idx]);
        }
      } else {
        // Numbers on the line above were scanned before this symbol was known.
        for (size_t prev_idx = 0; prev_idx < previous.size(); ++prev_idx) {
          auto const & candidate = previous[prev_idx];
          if (candidate.is_number() && candidate.touches(component)) {
            count(candidate, previous_counted.at(prev_idx));
          }
        }
      }
    });

    accumulator.previous_line.assign(line.begin(), line.end());
    accumulator.previous_counted = std::move(counted);
    return accumulator;
  }

  gear_accumulator_t scan_gears(gear_accumulator_t accumulator,
                                std::span<component_t const> line,
                                scan_order_t order) {
    auto & gears = accumulator.gears;
    auto const & previous = accumulator.previous_line;

    for_each_in_order(line, order, [&](size_t idx) {
      auto const & component = line[idx];

      if (component.is_gear()) {
        auto & numbers = gears[component.position()];

        for_each_line_neighbor(line, idx, [&](component_t const & neighbor) {
          if (neighbor.is_number()) {
            numbers.push_back(neighbor.number());
          }
        });

        for (auto const & candidate : previous) {
          if (candidate.is_number() && candidate.touches(component)) {
            numbers.push_back(candidate.number());
          }
        }
      } else if (component.is_number()) {
        // Gears on the line above were registered when that line was scanned.
        for (auto const & candidate : previous) {
          if (candidate.is_gear() && candidate.touches(component)) {
            auto const gear_it = gears.find(candidate.position());
            check(gear_it != gears.end(), "Gear at line {}, column {} was never registered",
                  candidate.line, candidate.column);
            gear_it->second.push_back(component.number());
          }
        }
      }
    });

    accumulator.previous_line.assign(line.begin(), line.end());
    return accumulator;
  }

  uint64_t sum_gear_ratios(gear_map_t const & gears) {
    uint64_t sum = 0;

    for (auto const & [position, numbers] : gears) {
      SPDLOG_TRACE("Gear @ ({}, {}): {}", position.line, position.column, numbers);
      if (numbers.size() == 2) {
        sum += uint64_t{numbers[0]} * numbers[1];
      }
    }

    return sum;
  }

  uint64_t stream_part_numbers(simd_string_view_t input, scan_order_t order) {
    part_accumulator_t accumulator;
    size_t line_idx = 0;

    for (auto const line : split_lines(input)) {
      auto const components = tokenize_line(line, line_idx++);
      accumulator = scan_parts(std::move(accumulator), components, order);
    }

    SPDLOG_DEBUG("Found {} part numbers in {} lines", accumulator.num_parts, line_idx);
    return accumulator.sum;
  }

  uint64_t stream_gear_ratios(simd_string_view_t input, scan_order_t order) {
    gear_accumulator_t accumulator;
    size_t line_idx = 0;

    for (auto const line : split_lines(input)) {
      auto const components = tokenize_line(line, line_idx++);
      accumulator = scan_gears(std::move(accumulator), components, order);
    }

    SPDLOG_DEBUG("Found {} gear candidates in {} lines", accumulator.gears.size(), line_idx);
    return sum_gear_ratios(accumulator.gears);
  }

  schematic_t::schematic_t(simd_string_view_t input) {
    for (auto const line : split_lines(input)) {
      lines_.push_back(tokenize_line(line, lines_.size()));
    }
  }

  uint64_t schematic_t::sum_part_numbers() const {
    uint64_t sum = 0;

    for (auto const & line : lines_) {
      for (auto const & component : line | std::views::filter(&component_t::is_number)) {
        bool touches_symbol = false;
        for_each_neighbor(component, [&](component_t const & neighbor) {
          touches_symbol |= neighbor.is_symbol();
        });

        if (touches_symbol) {
          sum += component.number();
        }
      }
    }

    return sum;
  }

  uint64_t schematic_t::sum_gear_ratios() const {
    uint64_t sum = 0;

    for (auto const & line : lines_) {
      for (auto const & gear : line | std::views::filter(&component_t::is_gear)) {
        size_t num_numbers = 0;
        uint64_t ratio = 1;

        for_each_neighbor(gear, [&](component_t const & neighbor) {
          if (neighbor.is_number()) {
            ++num_numbers;
            ratio *= neighbor.number();
          }
        });

        SPDLOG_TRACE("{} touches {} numbers", gear, num_numbers);
        if (num_numbers == 2) {
          sum += ratio;
        }
      }
    }

    return sum;
  }

  std::string format_as(component_t const & obj) {
    if (obj.is_number()) {
      return fmt::format("{} @ ({}, {})", obj.number(), obj.line, obj.column);
    } else {
      return fmt::format("'{}' @ ({}, {})", obj.symbol(), obj.line, obj.column);
    }
  }

}  // namespace aoc23::schematic
