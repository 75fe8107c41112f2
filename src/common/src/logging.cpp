#include "aoc23/logging.hpp"

#include <fmt/format.h>
#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

namespace aoc23 {

  void setup_logging(int argc, char ** argv) {
    spdlog::set_level(static_cast<spdlog::level::level_enum>(SPDLOG_ACTIVE_LEVEL));
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    spdlog::cfg::load_env_levels();
    spdlog::cfg::load_argv_levels(argc, argv);
  }

  std::string log_prefix(size_t day, size_t part) {
    return fmt::format("day {:02} - part {}", day, part);
  }

}  // namespace aoc23
