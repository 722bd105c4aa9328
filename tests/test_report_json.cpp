#include "catch2_custom.hpp"

#include <gradebox/model/report.hpp>
#include <gradebox/model/test_outcome.hpp>

#include "report/report_json.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

using namespace gradebox;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

Report make_report() {
    Report report;
    report.status = OverallStatus::Failed;
    report.points = 1.0;
    report.max_points = 3.0;
    report.score = 1.0 / 3.0;
    report.message = "summary";

    report.tests.push_back({.name = "visible one",
                            .description = "Checks the sum",
                            .status = TestStatus::Passed,
                            .output = "Output: Correct",
                            .message = "Expected Output: 7",
                            .duration = 1500ms,
                            .points = 1.0,
                            .max_points = 1.0});
    report.tests.push_back({.name = "secret edge case",
                            .description = "Negative numbers",
                            .status = TestStatus::Failed,
                            .output = "Your Program's Output: -3",
                            .message = "Expected Output: -4",
                            .points = 0.0,
                            .max_points = 1.0,
                            .hidden = true});
    report.tests.push_back({.name = "another secret",
                            .status = TestStatus::TimedOut,
                            .output = "Your Program took longer than 1 seconds to complete.",
                            .output_truncated = true,
                            .points = 0.0,
                            .max_points = 1.0,
                            .hidden = true});
    report.tests.push_back({.name = "practice",
                            .status = TestStatus::Failed,
                            .output = "Output: Mismatch",
                            .points = 0.0,
                            .max_points = 0.0,
                            .scored = false});

    return report;
}

} // namespace

TEST_CASE("Report document layout") {
    json doc = to_json_document(make_report());

    REQUIRE(doc.at("schema_version") == Report::SCHEMA_VERSION);
    REQUIRE(doc.at("gradable") == true);
    REQUIRE(doc.at("status") == "failed");
    REQUIRE(doc.at("points") == 1.0);
    REQUIRE(doc.at("max_points") == 3.0);
    REQUIRE(doc.at("message") == "summary");
    REQUIRE(doc.at("tests").size() == 4);

    const json& visible = doc.at("tests").at(0);
    REQUIRE(visible.at("name") == "visible one");
    REQUIRE(visible.at("description") == "Checks the sum");
    REQUIRE(visible.at("status") == "passed");
    REQUIRE(visible.at("output") == "Output: Correct");
    REQUIRE(visible.at("message") == "Expected Output: 7");
    REQUIRE(visible.at("duration") == 1.5);
    REQUIRE_FALSE(visible.contains("hidden"));
    REQUIRE_FALSE(visible.contains("scored"));

    const json& unscored = doc.at("tests").at(3);
    REQUIRE(unscored.at("scored") == false);
    REQUIRE(unscored.at("max_points") == 0.0);
}

TEST_CASE("Hidden tests reveal nothing but their result") {
    json doc = to_json_document(make_report());

    const json& first_hidden = doc.at("tests").at(1);
    REQUIRE(first_hidden.at("name") == "Hidden test 1");
    REQUIRE(first_hidden.at("status") == "failed");
    REQUIRE(first_hidden.at("max_points") == 1.0);
    REQUIRE(first_hidden.at("output") == "");
    REQUIRE(first_hidden.at("hidden") == true);
    REQUIRE_FALSE(first_hidden.contains("description"));
    REQUIRE_FALSE(first_hidden.contains("message"));

    const json& second_hidden = doc.at("tests").at(2);
    REQUIRE(second_hidden.at("name") == "Hidden test 2");
    REQUIRE(second_hidden.at("status") == "timed-out");
    REQUIRE(second_hidden.at("output_truncated") == false);

    std::string text = serialize_report(make_report());
    REQUIRE(text.find("secret") == std::string::npos);
    REQUIRE(text.find("Negative numbers") == std::string::npos);
}

TEST_CASE("Ungradable and build-error statuses") {
    Report report;
    report.gradable = false;
    report.status = OverallStatus::Ungradable;

    json doc = to_json_document(report);
    REQUIRE(doc.at("gradable") == false);
    REQUIRE(doc.at("status") == "ungradable");
    REQUIRE(doc.at("tests").empty());

    report.gradable = true;
    report.status = OverallStatus::BuildError;
    REQUIRE(to_json_document(report).at("status") == "build-error");
}

TEST_CASE("Invalid UTF-8 in captured output is not fatal") {
    Report report;
    report.tests.push_back({.name = "binary garbage", .status = TestStatus::Failed, .output = "ok \xff\xfe bytes"});

    std::string text;
    REQUIRE_NOTHROW(text = serialize_report(report));

    json reparsed = json::parse(text);
    REQUIRE(reparsed.at("tests").at(0).at("output").get<std::string>().starts_with("ok "));
    REQUIRE(text.ends_with("\n"));
}
