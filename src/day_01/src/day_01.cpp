#include "aoc23/day_01.hpp"

#include "aoc23/string.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <optional>
#include <string_view>

namespace aoc23 {

  namespace {

    static constexpr auto digit_names = std::to_array<std::string_view>({
        "one", "two", "three", "four", "five", "six", "seven", "eight", "nine",
    });

    template <bool AllowSpelled>
    std::optional<uint8_t> digit_at(std::string_view line, size_t pos) {
      char const c = line[pos];
      if ((c >= '0') && (c <= '9')) {
        return static_cast<uint8_t>(c - '0');
      }

      if constexpr (AllowSpelled) {
        auto const rest = line.substr(pos);
        for (size_t idx = 0; idx < digit_names.size(); ++idx) {
          if (rest.starts_with(digit_names[idx])) {
            return static_cast<uint8_t>(idx + 1);
          }
        }
      }

      return std::nullopt;
    }

    template <bool AllowSpelled>
    uint32_t calibration_value(std::string_view line) {
      std::optional<uint8_t> first;
      for (size_t pos = 0; (pos < line.size()) && !first; ++pos) {
        first = digit_at<AllowSpelled>(line, pos);
      }

      if (!first) {
        throw parse_error(fmt::format("Couldn't find a digit in line '{}'", line));
      }

      // Search from the back separately, since spelled digits may overlap ("twone" ends in 1).
      std::optional<uint8_t> last;
      for (size_t pos = line.size(); (pos > 0) && !last; --pos) {
        last = digit_at<AllowSpelled>(line, pos - 1);
      }

      SPDLOG_TRACE("'{}' -> {}{}", line, *first, *last);
      return 10 * *first + *last;
    }

    template <bool AllowSpelled>
    uint32_t sum_calibration_values(simd_string_view_t input) {
      uint32_t sum = 0;
      for (auto const line : split_lines(input)) {
        sum += calibration_value<AllowSpelled>(line);
      }
      return sum;
    }

  }  // namespace

  uint32_t day_t<1>::solve(part_t<1>, simd_string_view_t input) {
    return sum_calibration_values<false>(input);
  }

  uint32_t day_t<1>::solve(part_t<2>, simd_string_view_t input) {
    return sum_calibration_values<true>(input);
  }

}  // namespace aoc23
