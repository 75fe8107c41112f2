#include "aoc23/day_02.hpp"

#include "aoc23/string.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <vector>

namespace aoc23 {

  namespace {

    struct cube_set_t {
      uint32_t red = 0;
      uint32_t green = 0;
      uint32_t blue = 0;

      bool fits_in(cube_set_t const & other) const {
        return (red <= other.red) && (green <= other.green) && (blue <= other.blue);
      }
    };

    struct game_t {
      uint32_t id;
      std::vector<cube_set_t> draws;
    };

    static constexpr cube_set_t bag_contents{.red = 12, .green = 13, .blue = 14};

    cube_set_t parse_draw(std::string_view draw) {
      cube_set_t result;

      for (auto const entry : split_lines(draw, ',')) {
        auto const cubes = trim(entry);
        auto const space = cubes.find(' ');
        if (space == cubes.npos) {
          throw parse_error(fmt::format("Expected '<count> <colour>', got '{}'", cubes));
        }

        auto const count = to_int<uint32_t>(cubes.substr(0, space));
        auto const colour = trim(cubes.substr(space + 1));

        if (colour == "red") {
          result.red += count;
        } else if (colour == "green") {
          result.green += count;
        } else if (colour == "blue") {
          result.blue += count;
        } else {
          throw parse_error(fmt::format("Invalid colour '{}'", colour));
        }
      }

      return result;
    }

    game_t parse_game(std::string_view line) {
      try {
        auto const colon = line.find(':');
        if (colon == line.npos) {
          throw parse_error("Expected a ':' after the game id");
        }

        auto const header = trim(line.substr(0, colon));
        if (!header.starts_with("Game ")) {
          throw parse_error(fmt::format("Expected 'Game <id>', got '{}'", header));
        }

        game_t game{.id = to_int<uint32_t>(trim(header.substr(header.rfind(' ') + 1))), .draws = {}};
        for (auto const draw : split_lines(line.substr(colon + 1), ';')) {
          game.draws.push_back(parse_draw(draw));
        }

        return game;
      } catch (parse_error const & ex) {
        throw parse_error(fmt::format("In '{}': {}", line, ex.what()));
      }
    }

    template <class Fn>
    void for_each_game(simd_string_view_t input, Fn && fn) {
      for (auto const line : split_lines(input)) {
        fn(parse_game(line));
      }
    }

  }  // namespace

  uint32_t day_t<2>::solve(part_t<1>, simd_string_view_t input) {
    uint32_t sum = 0;

    for_each_game(input, [&](game_t const & game) {
      bool const possible = std::ranges::all_of(
          game.draws, [](cube_set_t const & draw) { return draw.fits_in(bag_contents); });
      SPDLOG_TRACE("Game {}: possible = {}", game.id, possible);
      sum += possible ? game.id : 0;
    });

    return sum;
  }

  uint64_t day_t<2>::solve(part_t<2>, simd_string_view_t input) {
    uint64_t sum = 0;

    for_each_game(input, [&](game_t const & game) {
      cube_set_t minimal;
      for (auto const & draw : game.draws) {
        minimal.red = std::max(minimal.red, draw.red);
        minimal.green = std::max(minimal.green, draw.green);
        minimal.blue = std::max(minimal.blue, draw.blue);
      }

      SPDLOG_TRACE("Game {}: minimal set = ({}, {}, {})", game.id, minimal.red, minimal.green,
                   minimal.blue);
      sum += uint64_t{minimal.red} * minimal.green * minimal.blue;
    });

    return sum;
  }

}  // namespace aoc23
