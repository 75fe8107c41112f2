#include <catch2/catch.hpp>

#include "aoc23/file.hpp"
#include "aoc23/simd.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

using namespace aoc23;

namespace {

  struct temp_dir_t {
    temp_dir_t()
        : path(std::filesystem::temp_directory_path() / "aoc23_test_file") {
      std::filesystem::remove_all(path);
      std::filesystem::create_directories(path);
    }

    ~temp_dir_t() {
      std::error_code ec;
      std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path write(std::string const & name, std::string const & contents) const {
      auto const file = path / name;
      std::ofstream{file, std::ios::binary} << contents;
      return file;
    }

    std::filesystem::path path;
  };

}  // namespace

TEST_CASE("read_file trims and appends a single newline", "[file]") {
  temp_dir_t const dir;
  auto const file = dir.write("input.txt", "\n\n467..114..\n...*......\n\n\n");

  auto const contents = read_file(file);
  REQUIRE(std::string_view{contents} == "467..114..\n...*......\n");
}

TEST_CASE("read_file keeps spaces on the first and last line", "[file]") {
  temp_dir_t const dir;
  auto const file = dir.write("input.txt", "\r\n  .*\n12  \r\n\n");

  REQUIRE(std::string_view{read_file(file)} == "  .*\n12  \n");
}

TEST_CASE("read_file adds a newline when the file has none", "[file]") {
  temp_dir_t const dir;
  auto const file = dir.write("input.txt", "abc");

  REQUIRE(std::string_view{read_file(file)} == "abc\n");
}

TEST_CASE("read_file of an empty file is a single newline", "[file]") {
  temp_dir_t const dir;
  auto const file = dir.write("empty.txt", "");

  REQUIRE(std::string_view{read_file(file)} == "\n");
}

TEST_CASE("read_file returns an aligned buffer", "[file]") {
  temp_dir_t const dir;
  auto const file = dir.write("input.txt", std::string(1000, '.'));

  auto const contents = read_file(file);
  REQUIRE(reinterpret_cast<std::uintptr_t>(contents.data()) % simd_alignment_bytes == 0);
}

TEST_CASE("read_file of a missing file names the file", "[file]") {
  temp_dir_t const dir;
  auto const missing = dir.path / "does_not_exist.txt";

  REQUIRE_THROWS_AS(read_file(missing), file_read_error);
  REQUIRE_THROWS_WITH(read_file(missing), Catch::Contains("does_not_exist.txt"));
}

TEST_CASE("resolve_symlink follows relative links", "[file]") {
  temp_dir_t const dir;
  auto const target = dir.write("target.txt", "x");
  std::filesystem::create_directories(dir.path / "links");
  std::filesystem::create_symlink("../target.txt", dir.path / "links" / "link.txt");

  auto const resolved = resolve_symlink(dir.path / "links" / "link.txt");
  REQUIRE(std::filesystem::equivalent(resolved, target));
  REQUIRE(resolve_symlink(target) == target);
}
