#include "catch2_custom.hpp"

#include "suite/search_path.hpp"

#include <filesystem>
#include <optional>
#include <vector>

using gradebox::SearchPath;

namespace fs = std::filesystem;

const auto resources_path = fs::path{RESOURCES_DIR};

TEST_CASE("Parse colon-separated paths") {
    SearchPath path = SearchPath::parse("/grade/tests::/grade/serverFilesCourse:");

    REQUIRE(path.get_dirs() == std::vector<fs::path>{"/grade/tests", "/grade/serverFilesCourse"});
    REQUIRE(path.to_string() == "/grade/tests:/grade/serverFilesCourse");

    REQUIRE(SearchPath::parse("").get_dirs().empty());
}

TEST_CASE("Resolve files in search order") {
    SearchPath path{{resources_path / "suites" / "basic", resources_path / "shared"}};

    SECTION("First directory wins") {
        REQUIRE(path.resolve("input.txt").value() == resources_path / "suites" / "basic" / "input.txt");
    }

    SECTION("Later directories are searched") {
        REQUIRE(path.resolve("common_input.txt").value() == resources_path / "shared" / "common_input.txt");
    }

    SECTION("The preferred directory is tried first") {
        REQUIRE(path.resolve("expected_sum.txt", resources_path / "suites" / "basic" / "fixtures").value() ==
                resources_path / "suites" / "basic" / "fixtures" / "expected_sum.txt");
    }

    SECTION("Missing files") {
        REQUIRE_FALSE(path.resolve("nope.txt").has_value());
        REQUIRE_FALSE(path.resolve("/definitely/not/here.txt").has_value());
    }

    SECTION("Absolute paths bypass the search") {
        auto absolute = resources_path / "shared" / "common_input.txt";
        REQUIRE(SearchPath{}.resolve(absolute).value() == absolute);
    }
}
