#include <catch2/catch.hpp>

#include "aoc23/string.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

using namespace aoc23;

// ===== trim =====

TEST_CASE("trim removes surrounding whitespace", "[string]") {
  REQUIRE(trim(std::string_view{"  abc \n"}) == "abc");
  REQUIRE(trim(std::string_view{"a b"}) == "a b");
  REQUIRE(trim(std::string{"\t42\r\n"}) == "42");
}

TEST_CASE("trim of whitespace only is empty", "[string]") {
  REQUIRE(trim(std::string_view{" \n\t "}).empty());
  REQUIRE(trim(std::string_view{}).empty());
}

TEST_CASE("trim_line_breaks keeps other whitespace", "[string]") {
  REQUIRE(trim_line_breaks(std::string_view{"\n\r\n  abc \r\n\n"}) == "  abc ");
  REQUIRE(trim_line_breaks(std::string_view{"\n\n"}).empty());
  REQUIRE(trim_line_breaks(std::string{" \t"}) == " \t");
}

// ===== to_int =====

TEST_CASE("to_int converts whole strings", "[string]") {
  REQUIRE(to_int<uint32_t>("0") == 0);
  REQUIRE(to_int<uint32_t>("467") == 467);
  REQUIRE(to_int<int>("-12") == -12);
  REQUIRE(to_int<uint64_t>("18446744073709551615") == UINT64_MAX);
}

TEST_CASE("to_int rejects malformed input", "[string]") {
  REQUIRE_THROWS_AS(to_int<uint32_t>(""), parse_error);
  REQUIRE_THROWS_AS(to_int<uint32_t>("abc"), parse_error);
  REQUIRE_THROWS_AS(to_int<uint32_t>("12a"), parse_error);
  REQUIRE_THROWS_AS(to_int<uint32_t>(" 12"), parse_error);
}

TEST_CASE("to_int rejects values out of range", "[string]") {
  REQUIRE_THROWS_AS(to_int<uint8_t>("256"), parse_error);
  REQUIRE(to_int<uint8_t>("255") == 255);
  REQUIRE_THROWS_WITH(to_int<uint32_t>("99999999999"), Catch::Contains("99999999999"));
}

// ===== split_lines =====

TEST_CASE("split_lines splits on newlines", "[string]") {
  auto const lines = split_lines("ab\ncd\nef\n");
  REQUIRE(lines == std::vector<simd_string_view_t>{"ab", "cd", "ef"});
}

TEST_CASE("split_lines keeps the last line without newline", "[string]") {
  auto const lines = split_lines("ab\ncd");
  REQUIRE(lines == std::vector<simd_string_view_t>{"ab", "cd"});
}

TEST_CASE("split_lines keeps empty lines in between", "[string]") {
  auto const lines = split_lines("ab\n\n\ncd\n");
  REQUIRE(lines == std::vector<simd_string_view_t>{"ab", "", "", "cd"});
}

TEST_CASE("split_lines of empty input is empty", "[string]") {
  REQUIRE(split_lines("").empty());
  REQUIRE(split_lines("\n") == std::vector<simd_string_view_t>{""});
}

TEST_CASE("split_lines drops carriage returns before newlines", "[string]") {
  auto const lines = split_lines("ab\r\ncd\r\n");
  REQUIRE(lines == std::vector<simd_string_view_t>{"ab", "cd"});
}

TEST_CASE("split_lines with another splitter", "[string]") {
  auto const parts = split_lines(" 3 blue, 4 red\r", ',');
  REQUIRE(parts == std::vector<simd_string_view_t>{" 3 blue", " 4 red\r"});
}

TEST_CASE("split_lines handles lines spanning several vectors", "[string]") {
  std::string input;
  std::vector<std::string> expected;
  for (size_t idx = 0; idx < 50; ++idx) {
    expected.push_back(std::string(idx * 7 % 150, static_cast<char>('a' + idx % 26)));
    input += expected.back();
    input += '\n';
  }

  auto const lines = split_lines(input);
  REQUIRE(lines.size() == expected.size());
  for (size_t idx = 0; idx < lines.size(); ++idx) {
    REQUIRE(lines[idx] == expected[idx]);
  }
}
