#pragma once

#include "aoc23/simd.hpp"

#include <fmt/format.h>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace aoc23::schematic {

  /// Filler character. Separates tokens, but never is one.
  inline constexpr char blank = '.';

  /// The only symbol which can be a gear.
  inline constexpr char gear_symbol = '*';

  using number_t = uint32_t;

  enum class run_kind_t : uint8_t {
    digits,
    blanks,
    symbol,
  };

  /// @brief Part of a line consisting of a single kind of character.
  struct run_t {
    run_kind_t kind;
    std::string_view text;
  };

  /** @brief Splits a line into maximal runs of digits, maximal runs of blanks and single symbols.
   *
   * The runs are returned in order. Concatenating their text reproduces `line` exactly.
   */
  std::vector<run_t> split_runs(std::string_view line);

  /// @brief Location of the first character of a component in the schematic.
  struct position_t {
    size_t line;
    size_t column;

    auto operator<=>(position_t const &) const = default;
  };

  /** @brief A number or symbol, together with where it was found.
   *
   * The footprint of a component spans the lines above and below it and one column on each side,
   * i.e. lines [line - 1, line + 1] and columns [column - 1, column + length]. Two components
   * touch if one lies within the footprint of the other.
   */
  struct component_t {
    std::variant<number_t, char> token;
    size_t line;
    size_t column;
    size_t length;

    bool is_number() const { return std::holds_alternative<number_t>(token); }
    bool is_symbol() const { return std::holds_alternative<char>(token); }
    bool is_gear() const { return is_symbol() && (symbol() == gear_symbol); }

    number_t number() const { return std::get<number_t>(token); }
    char symbol() const { return std::get<char>(token); }

    position_t position() const { return {line, column}; }

    /// One past the last column covered by this component.
    size_t end_column() const { return column + length; }

    /// Whether the components are different and adjacent, horizontally, vertically or diagonally.
    bool touches(component_t const & other) const;

    bool operator==(component_t const &) const = default;
  };

  /** @brief Converts a line into its components. Blank runs are dropped, but still count towards
   * the column of the components after them.
   *
   * @throws parse_error If a digit run doesn't fit in number_t. The message names the line and
   * column of the run.
   * @throws check_failure If a symbol run is not exactly one character wide.
   */
  std::vector<component_t> tokenize_line(std::string_view line, size_t line_idx);

  /// @brief Order in which the components of a line are handled by the streaming scans.
  enum class scan_order_t : uint8_t {
    in_order,       ///< Left to right.
    symbols_first,  ///< All symbols left to right, then all numbers left to right.
    numbers_first,  ///< All numbers left to right, then all symbols left to right.
  };

  /** @brief Running state of the streaming part number scan.
   *
   * Only the components of the most recently scanned line are kept. Numbers of that line which
   * were already counted are flagged, so a symbol on the next line doesn't count them again.
   */
  struct part_accumulator_t {
    std::vector<component_t> previous_line;
    std::vector<uint8_t> previous_counted;
    uint64_t sum = 0;
    size_t num_parts = 0;
  };

  /// @brief Adds the part numbers that can be decided once `line` is known to the accumulator.
  part_accumulator_t scan_parts(part_accumulator_t accumulator,
                                std::span<component_t const> line,
                                scan_order_t order = scan_order_t::in_order);

  /// @brief Numbers touching each gear candidate, keyed by the gear's position.
  using gear_map_t = std::map<position_t, std::vector<number_t>>;

  /** @brief Running state of the streaming gear scan. The gear map lives for the whole input,
   * since numbers on the line below a gear are only seen one line later.
   */
  struct gear_accumulator_t {
    std::vector<component_t> previous_line;
    gear_map_t gears;
  };

  /// @brief Registers gears of `line` and the numbers touching gears on `line` or the line above.
  gear_accumulator_t scan_gears(gear_accumulator_t accumulator,
                                std::span<component_t const> line,
                                scan_order_t order = scan_order_t::in_order);

  /// @brief Sum of n1 * n2 over all gears touching exactly two numbers.
  uint64_t sum_gear_ratios(gear_map_t const & gears);

  /// @brief Streams over all lines of the input, keeping only two lines of components in memory.
  uint64_t stream_part_numbers(simd_string_view_t input,
                               scan_order_t order = scan_order_t::in_order);

  /// @brief Streams over all lines of the input, returning the sum of all gear ratios.
  uint64_t stream_gear_ratios(simd_string_view_t input,
                              scan_order_t order = scan_order_t::in_order);

  /** @brief Fully parsed schematic, with the components of every line.
   *
   * Adjacency is a pure function of position here: each component looks up the lines above,
   * below and its own line directly, so no bookkeeping is needed across lines.
   */
  class schematic_t {
   public:
    /// @throws parse_error, check_failure See tokenize_line().
    explicit schematic_t(simd_string_view_t input);

    size_t num_lines() const { return lines_.size(); }
    std::span<component_t const> line(size_t idx) const { return lines_.at(idx); }

    /// @brief Calls `fn(neighbor)` for every component touching `component`, line by line.
    template <class Fn>
    void for_each_neighbor(component_t const & component, Fn && fn) const;

    /// @brief Sum of all numbers touching at least one symbol.
    uint64_t sum_part_numbers() const;

    /// @brief Sum of n1 * n2 over all gears touching exactly two numbers.
    uint64_t sum_gear_ratios() const;

   private:
    std::vector<std::vector<component_t>> lines_;
  };

  std::string format_as(component_t const & obj);

}  // namespace aoc23::schematic

// fmt 9 doesn't look up format_as() itself.
template <>
struct fmt::formatter<aoc23::schematic::component_t> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(aoc23::schematic::component_t const & obj, FormatContext & ctx) const {
    return fmt::formatter<std::string_view>::format(aoc23::schematic::format_as(obj), ctx);
  }
};

#include "aoc23/schematic.tpp"
