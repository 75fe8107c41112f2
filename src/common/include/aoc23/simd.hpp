#pragma once

#include "aoc23/memory.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace aoc23 {

  static constexpr size_t simd_alignment_bytes = 512 / 8;

  template <size_t Alignment>
  using aligned_string_t =
      std::basic_string<char, std::char_traits<char>, aligned_allocator<char, Alignment>>;

  /** @brief A string whose buffer is aligned to aoc23::simd_alignment_bytes. This allows using it
   * with aligned SIMD loads.
   */
  using simd_string_t = aligned_string_t<simd_alignment_bytes>;

  /** @brief View on puzzle input. Solvers take their input as this type.
   *
   * @note Views created from a simd_string_t may be read up to the next multiple of
   * aoc23::simd_alignment_bytes past their end, but code in this project never relies on that, so
   * views on ordinary strings are accepted as well.
   */
  using simd_string_view_t = std::string_view;

}  // namespace aoc23
