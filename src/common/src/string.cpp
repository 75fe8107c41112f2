#include "aoc23/string.hpp"

#include <spdlog/spdlog.h>

#include <bit>
#include <cstddef>
#include <cstdint>

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "src/string.cpp"

// clang-format off
#include <hwy/foreach_target.h>
// clang-format on

#include <hwy/highway.h>

HWY_BEFORE_NAMESPACE();

namespace aoc23 {
  namespace HWY_NAMESPACE {

    namespace hn = hwy::HWY_NAMESPACE;

    std::vector<simd_string_view_t> split_lines(simd_string_view_t input, char splitter) {
      static constexpr hn::ScalableTag<uint8_t> tag{};
      size_t const lanes = hn::Lanes(tag);

      auto const * HWY_RESTRICT data = reinterpret_cast<uint8_t const *>(input.data());
      auto const splitters = hn::Set(tag, static_cast<uint8_t>(splitter));

      std::vector<simd_string_view_t> result;
      size_t line_start = 0;

      auto const emit = [&](size_t line_end) {
        auto line = input.substr(line_start, line_end - line_start);
        if ((splitter == '\n') && line.ends_with('\r')) {
          line.remove_suffix(1);
        }

        result.push_back(line);
        line_start = line_end + 1;  // +1 to skip the splitter.
      };

      // Full chunks use unaligned loads, so the input does not need to be padded.
      size_t idx = 0;
      for (; idx + lanes <= input.size(); idx += lanes) {
        auto const chunk = hn::LoadU(tag, data + idx);
        uint64_t bits = hn::BitsFromMask(tag, hn::Eq(chunk, splitters));

        for (; bits != 0; bits &= (bits - 1)) {
          emit(idx + std::countr_zero(bits));
        }
      }

      // Less than a vector remains, scan it one character at a time.
      for (; idx < input.size(); ++idx) {
        if (input[idx] == splitter) {
          emit(idx);
        }
      }

      if (line_start < input.size()) {  // Handle last line if not ending with a splitter.
        emit(input.size());
      }

      SPDLOG_TRACE("Split {} bytes into {} parts on {:?}", input.size(), result.size(), splitter);
      return result;
    }

  }  // namespace HWY_NAMESPACE
}  // namespace aoc23

HWY_AFTER_NAMESPACE();

#ifdef HWY_ONCE

namespace aoc23 {
  HWY_EXPORT(split_lines);

  std::vector<simd_string_view_t> split_lines(simd_string_view_t input, char splitter) {
    return HWY_DYNAMIC_DISPATCH(split_lines)(input, splitter);
  }

}  // namespace aoc23

#endif
