#include <catch2/catch.hpp>

#include "aoc23/check.hpp"

#include <string>

using namespace aoc23;

TEST_CASE("check passes on true conditions", "[check]") {
  REQUIRE_NOTHROW(check(true, "Never formatted {}", 42));
}

TEST_CASE("check throws the formatted message", "[check]") {
  auto const width = 3;
  REQUIRE_THROWS_AS(check(false, "Symbol is {} characters wide", width), check_failure);
  REQUIRE_THROWS_WITH(check(false, "Symbol is {} characters wide", width),
                      "Symbol is 3 characters wide");
}

TEST_CASE("check_failure is a runtime_error", "[check]") {
  REQUIRE_THROWS_AS(check(false, "{} != {}", std::string{"a"}, std::string{"b"}),
                    std::runtime_error);
}
