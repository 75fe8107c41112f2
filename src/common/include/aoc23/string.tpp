#pragma once

#include "aoc23/string.hpp"  // Only for IDE.

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <limits>
#include <system_error>
#include <utility>

namespace aoc23 {

  namespace detail {

    /// Strips the characters for which `is_stripped` is true from both ends of `s`.
    template <class StringLike, class Predicate>
    StringLike strip_if(StringLike s, Predicate is_stripped) {
      auto const is_kept = [&](unsigned char c) { return !is_stripped(c); };

      auto const new_begin = std::ranges::find_if(s, is_kept);

      if (new_begin == s.end()) {  // If everything is stripped, stop.
        return {};
      }

      // There's at least one kept character, so this never yields s.rend().
      auto const new_end = std::find_if(s.rbegin(), s.rend(), is_kept).base();

      size_t const start_index = std::distance(s.begin(), new_begin);
      size_t const new_length = std::distance(new_begin, new_end);

      return std::move(s).substr(start_index, new_length);
    }

  }  // namespace detail

  template <class StringLike>
    requires requires(StringLike s) {
      { s.substr(0, 1) } -> std::same_as<StringLike>;
    }
  StringLike trim(StringLike s) {
    return detail::strip_if(std::move(s), [](unsigned char c) { return std::isspace(c) != 0; });
  }

  template <class StringLike>
    requires requires(StringLike s) {
      { s.substr(0, 1) } -> std::same_as<StringLike>;
    }
  StringLike trim_line_breaks(StringLike s) {
    return detail::strip_if(std::move(s),
                            [](unsigned char c) { return (c == '\n') || (c == '\r'); });
  }

  template <std::integral T>
  T to_int(std::string_view str) {
    T value{};
    auto const * const end = str.data() + str.size();
    auto const [ptr, ec] = std::from_chars(str.data(), end, value);

    if (ec == std::errc::result_out_of_range) [[unlikely]] {
      throw parse_error(fmt::format("Value '{}' does not fit in [{}, {}]", str,
                                    std::numeric_limits<T>::min(),
                                    std::numeric_limits<T>::max()));
    }

    if ((ec != std::errc{}) || (ptr != end)) [[unlikely]] {
      throw parse_error(fmt::format("Failed to convert '{}' to integer", str));
    }

    return value;
  }

}  // namespace aoc23
