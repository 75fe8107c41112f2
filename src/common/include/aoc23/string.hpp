#pragma once

#include "aoc23/simd.hpp"

#include <concepts>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace aoc23 {

  /// Exception thrown when part of the input can't be converted to the expected value.
  struct parse_error : public std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  /// @brief Strips leading and trailing whitespace.
  template <class StringLike>
    requires requires(StringLike s) {
      { s.substr(0, 1) } -> std::same_as<StringLike>;
    }
  StringLike trim(StringLike s);

  /// @brief Strips leading and trailing line breaks ('\n' and '\r'). Other whitespace is kept.
  template <class StringLike>
    requires requires(StringLike s) {
      { s.substr(0, 1) } -> std::same_as<StringLike>;
    }
  StringLike trim_line_breaks(StringLike s);

  /** @brief Converts the whole of `str` to an integer.
   *
   * @throws parse_error If `str` is empty, contains anything but the number, or if the value does
   * not fit in a T.
   */
  template <std::integral T>
  T to_int(std::string_view str);

  /** @brief Splits input on every occurrence of `splitter`.
   *
   * Empty substrings between two consecutive splitters are kept. A splitter at the very end of the
   * input does not produce a trailing empty substring. When splitting on newlines, a carriage
   * return right before the newline is not part of the line.
   */
  std::vector<simd_string_view_t> split_lines(simd_string_view_t input, char splitter = '\n');

}  // namespace aoc23

#include "aoc23/string.tpp"
