#include "catch2_custom.hpp"

#include "sandbox/privilege_separator.hpp"
#include "user/environment_config.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace gradebox;
using Catch::Matchers::ContainsSubstring;

namespace fs = std::filesystem;

namespace {

HarnessConfig::EnvironmentLookup lookup_in(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        if (auto iter = vars.find(name); iter != vars.end()) {
            return iter->second;
        }
        return std::nullopt;
    };
}

} // namespace

TEST_CASE("Defaults describe the standard container layout") {
    auto config = HarnessConfig::from_environment(lookup_in({}));

    REQUIRE(config);
    REQUIRE(config->grade_dir == fs::path{"/grade"});
    REQUIRE(config->submission_location == fs::path{"/grade/student"});
    REQUIRE(config->tests_location == fs::path{"/grade/tests"});
    REQUIRE(config->result_location == fs::path{"/grade/results/results.json"});
    REQUIRE(config->test_path.to_string() == "/grade/tests:/grade/serverFilesCourse");
    REQUIRE(config->sandbox);
    REQUIRE(config->sandbox_user == "sbuser");
    REQUIRE(config->jobs == 1);
    REQUIRE(config->max_output == 65536);
}

TEST_CASE("Every location can be overridden") {
    auto config = HarnessConfig::from_environment(lookup_in({{"GRADE_DIR", "/srv/grade"},
                                                              {"GRADEBOX_RESULT_LOCATION", "/out/result.json"},
                                                              {"GRADEBOX_TEST_PATH", "/a::/b"},
                                                              {"GRADEBOX_SANDBOX", "off"},
                                                              {"GRADEBOX_SANDBOX_USER", "nobody"},
                                                              {"GRADEBOX_JOBS", "4"},
                                                              {"GRADEBOX_MAX_OUTPUT", "1024"},
                                                              {"GRADEBOX_SCRATCH_DIR", "/var/tmp/gb"},
                                                              // Empty values count as unset
                                                              {"GRADEBOX_TESTS_LOCATION", ""}}));

    REQUIRE(config);
    REQUIRE(config->submission_location == fs::path{"/srv/grade/student"});
    REQUIRE(config->tests_location == fs::path{"/srv/grade/tests"});
    REQUIRE(config->result_location == fs::path{"/out/result.json"});
    REQUIRE(config->test_path.get_dirs() == std::vector<fs::path>{"/a", "/b"});
    REQUIRE_FALSE(config->sandbox);
    REQUIRE(config->sandbox_user == "nobody");
    REQUIRE(config->jobs == 4);
    REQUIRE(config->max_output == 1024);
    REQUIRE(config->scratch_dir == fs::path{"/var/tmp/gb"});

    SandboxLayout layout = config->make_sandbox_layout();
    REQUIRE(layout.grade_root == fs::path{"/srv/grade"});
    REQUIRE(layout.results_dir == fs::path{"/out"});
    REQUIRE(layout.fixture_dirs == std::vector<fs::path>{"/srv/grade/tests", "/a", "/b"});
}

TEST_CASE("Malformed values are rejected") {
    REQUIRE_THAT(HarnessConfig::from_environment(lookup_in({{"GRADEBOX_SANDBOX", "maybe"}})).error(),
                 ContainsSubstring("GRADEBOX_SANDBOX must be \"on\" or \"off\""));
    REQUIRE_THAT(HarnessConfig::from_environment(lookup_in({{"GRADEBOX_JOBS", "0"}})).error(),
                 ContainsSubstring("GRADEBOX_JOBS must be a positive integer"));
    REQUIRE_THAT(HarnessConfig::from_environment(lookup_in({{"GRADEBOX_MAX_OUTPUT", "12k"}})).error(),
                 ContainsSubstring("GRADEBOX_MAX_OUTPUT"));
    REQUIRE_THAT(HarnessConfig::from_environment(lookup_in({{"GRADEBOX_RESULT_LOCATION", "/grade/results/"}})).error(),
                 ContainsSubstring("must name a file"));
}

TEST_CASE("Switch spellings") {
    REQUIRE(parse_switch("X", "on") == true);
    REQUIRE(parse_switch("X", "yes") == true);
    REQUIRE(parse_switch("X", "1") == true);
    REQUIRE(parse_switch("X", "false") == false);
    REQUIRE_FALSE(parse_switch("X", "ON").has_value());
}

TEST_CASE("Validation checks the directories exist") {
    TempDir grade{"gradebox-env"};
    fs::create_directories(grade.path() / "tests");
    fs::create_directories(grade.path() / "student");

    auto config = HarnessConfig::from_environment(lookup_in({{"GRADE_DIR", grade.path().string()}}));
    REQUIRE(config);
    REQUIRE(config->validate());

    fs::remove(grade.path() / "student");
    REQUIRE_THAT(config->validate().error(), ContainsSubstring("Submission directory"));
}
