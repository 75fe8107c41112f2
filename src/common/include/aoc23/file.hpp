#pragma once

#include "aoc23/simd.hpp"

#include <filesystem>
#include <stdexcept>

namespace aoc23 {

  /// Exception thrown when an input file can't be opened or read. The message names the file.
  struct file_read_error : public std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  /** @brief Returns file contents without leading and trailing line breaks.
   *
   * @returns Contents of the file at `file`, without the line breaks at its start and end. Other
   * whitespace is kept, since it may be part of the first or last line. The last character is
   * always a newline. This
   * is to simplify parsing when there's multiple lines. The string's buffer is aligned to
   * aoc23::simd_alignment_bytes.
   *
   * @throws file_read_error If the file could not be opened or read.
   */
  simd_string_t read_file(std::filesystem::path const & file);

  /// @brief Resolves path to its target. If path is not a symlink, returns the path itself.
  std::filesystem::path resolve_symlink(std::filesystem::path path);

}  // namespace aoc23
