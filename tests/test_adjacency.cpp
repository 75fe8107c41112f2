#include <catch2/catch.hpp>

#include "aoc23/schematic.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <vector>

using namespace aoc23::schematic;

namespace {

  component_t number_at(number_t value, size_t line, size_t column, size_t length) {
    return {value, line, column, length};
  }

  component_t symbol_at(char symbol, size_t line, size_t column) {
    return {symbol, line, column, 1};
  }

  std::vector<component_t> neighbors_of(schematic_t const & schematic,
                                        component_t const & component) {
    std::vector<component_t> neighbors;
    schematic.for_each_neighbor(component,
                                [&](component_t const & neighbor) { neighbors.push_back(neighbor); });
    return neighbors;
  }

  constexpr char const * example =
      "467..114..\n"
      "...*......\n"
      "..35..633.\n"
      "......#...\n"
      "617*......\n"
      ".....+.58.\n"
      "..592.....\n"
      "......755.\n"
      "...$.*....\n"
      ".664.598..\n";

}  // namespace

// ===== component_t::touches =====

TEST_CASE("touching is symmetric and covers all eight directions", "[adjacency]") {
  auto const number = number_at(35, 5, 4, 2);

  auto const [line, column] = GENERATE(table<size_t, size_t>({
      {4, 3}, {4, 4}, {4, 5}, {4, 6},
      {5, 3}, {5, 6},
      {6, 3}, {6, 4}, {6, 5}, {6, 6},
  }));

  auto const symbol = symbol_at('#', line, column);
  REQUIRE(number.touches(symbol));
  REQUIRE(symbol.touches(number));
}

TEST_CASE("components one column outside the footprint don't touch", "[adjacency]") {
  auto const number = number_at(35, 5, 4, 2);

  REQUIRE_FALSE(number.touches(symbol_at('#', 5, 2)));
  REQUIRE_FALSE(number.touches(symbol_at('#', 5, 7)));
  REQUIRE_FALSE(number.touches(symbol_at('#', 4, 7)));
  REQUIRE_FALSE(number.touches(symbol_at('#', 6, 2)));
}

TEST_CASE("components two lines apart don't touch", "[adjacency]") {
  auto const number = number_at(35, 5, 4, 2);

  REQUIRE_FALSE(number.touches(symbol_at('#', 3, 4)));
  REQUIRE_FALSE(number.touches(symbol_at('#', 7, 5)));
}

TEST_CASE("components at column and line zero", "[adjacency]") {
  auto const number = number_at(467, 0, 0, 3);

  REQUIRE(number.touches(symbol_at('*', 1, 3)));
  REQUIRE(number.touches(symbol_at('*', 1, 0)));
  REQUIRE(number.touches(symbol_at('*', 0, 3)));
  REQUIRE_FALSE(number.touches(symbol_at('*', 1, 4)));
  REQUIRE(symbol_at('*', 0, 0).touches(number_at(1, 1, 1, 1)));
}

TEST_CASE("a component never touches itself", "[adjacency]") {
  auto const number = number_at(7, 2, 3, 1);
  REQUIRE_FALSE(number.touches(number));
}

TEST_CASE("numbers separated by a blank don't touch", "[adjacency]") {
  auto const components = tokenize_line("12.34", 0);

  REQUIRE(components.size() == 2);
  REQUIRE_FALSE(components[0].touches(components[1]));
}

TEST_CASE("numbers on consecutive lines touch diagonally", "[adjacency]") {
  auto const upper = tokenize_line("12...", 0);
  auto const lower = tokenize_line("..34.", 1);

  REQUIRE(upper[0].touches(lower[0]));
  REQUIRE(lower[0].touches(upper[0]));
}

// ===== schematic_t::for_each_neighbor =====

TEST_CASE("schematic keeps every line", "[adjacency]") {
  schematic_t const schematic{example};

  REQUIRE(schematic.num_lines() == 10);
  REQUIRE(schematic.line(0).size() == 2);
  REQUIRE(schematic.line(1).size() == 1);
  REQUIRE(schematic.line(9).size() == 2);
  REQUIRE_THROWS_AS(schematic.line(10), std::out_of_range);
}

TEST_CASE("neighbors of a symbol", "[adjacency]") {
  schematic_t const schematic{example};
  auto const star = schematic.line(1)[0];

  auto const neighbors = neighbors_of(schematic, star);
  REQUIRE(neighbors.size() == 2);
  REQUIRE(neighbors[0].number() == 467);
  REQUIRE(neighbors[1].number() == 35);
}

TEST_CASE("neighbors on the same line", "[adjacency]") {
  schematic_t const schematic{example};
  auto const star = schematic.line(4)[1];

  REQUIRE(star.is_gear());
  auto const neighbors = neighbors_of(schematic, star);
  REQUIRE(neighbors.size() == 1);
  REQUIRE(neighbors[0].number() == 617);
}

TEST_CASE("numbers without neighbors", "[adjacency]") {
  schematic_t const schematic{example};

  REQUIRE(neighbors_of(schematic, schematic.line(0)[1]).empty());  // 114
  REQUIRE(neighbors_of(schematic, schematic.line(5)[1]).empty());  // 58
}

TEST_CASE("neighbors at the last line", "[adjacency]") {
  schematic_t const schematic{example};
  auto const number = schematic.line(9)[1];

  REQUIRE(number.number() == 598);
  auto const neighbors = neighbors_of(schematic, number);
  REQUIRE(neighbors.size() == 1);
  REQUIRE(neighbors[0].symbol() == '*');
  REQUIRE(neighbors[0].position() == position_t{8, 5});
}

TEST_CASE("neighbors of a wide number span several components", "[adjacency]") {
  schematic_t const schematic{"#.$.%\n.123.\n&...@\n"};
  auto const number = schematic.line(1)[0];

  auto const neighbors = neighbors_of(schematic, number);
  REQUIRE(neighbors.size() == 5);
  for (auto const & neighbor : neighbors) {
    REQUIRE(neighbor.is_symbol());
  }
}

TEST_CASE("neighbors in an empty schematic", "[adjacency]") {
  schematic_t const schematic{""};

  REQUIRE(schematic.num_lines() == 0);
  REQUIRE(neighbors_of(schematic, number_at(1, 0, 0, 1)).empty());
}

TEST_CASE("components are printable", "[adjacency]") {
  REQUIRE(fmt::format("{}", number_at(467, 0, 0, 3)) == "467 @ (0, 0)");
  REQUIRE(fmt::format("{}", symbol_at('*', 1, 3)) == "'*' @ (1, 3)");
}
