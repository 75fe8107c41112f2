#pragma once

#include <cstddef>
#include <string>

namespace aoc23 {

  /** @brief Sets the default logging level to SPDLOG_ACTIVE_LEVEL, then lets the SPDLOG_LEVEL
   * environment variable and `SPDLOG_LEVEL=...` command line arguments override it (in that order
   * of preference).
   */
  void setup_logging(int argc, char ** argv);

  /// @brief Prefix used when logging anything about a specific day and part.
  std::string log_prefix(size_t day, size_t part);

}  // namespace aoc23
