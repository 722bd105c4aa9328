#include "catch2_custom.hpp"

#include <gradebox/model/report.hpp>

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "pipeline/grading_pipeline.hpp"
#include "sandbox/sandboxed_executor.hpp"
#include "user/environment_config.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace gradebox;
using Stage = GradingPipeline::Stage;
using Catch::Matchers::ContainsSubstring;

namespace fs = std::filesystem;

namespace {

const SandboxedExecutor unsandboxed{std::nullopt, ResourceLimits{}};

/// Records which hooks were called, in order
class RecordingSerializer : public Serializer
{
public:
    explicit RecordingSerializer(Sink& sink)
        : Serializer{sink, VerbosityLevel::Max} {}

    void on_run_metadata(const RunMetadata& /*data*/) override { events.emplace_back("metadata"); }

    void on_build_result(const BuildResult& data) override {
        events.push_back(data.succeeded() ? "build ok" : "build failed");
    }

    void on_test_result(const TestOutcome& data) override { events.push_back("test " + data.name); }

    void on_report(const Report& /*data*/) override { events.emplace_back("report"); }

    void on_warning(std::string_view what) override { events.push_back("warning " + std::string{what}); }

    void on_error(std::string_view what) override { events.push_back("error " + std::string{what}); }

    void finalize() override { events.emplace_back("finalize"); }

    std::vector<std::string> events;
};

class NullSink : public Sink
{
public:
    void write(std::string_view /*str*/) override {}
    void flush() override {}
};

/// A grade directory laid out the way the container provides it
struct GradeDir
{
    TempDir root{"gradebox-pipeline"};

    GradeDir() {
        fs::create_directories(root.path() / "student");
        fs::create_directories(root.path() / "tests");
    }

    HarnessConfig config() const {
        HarnessConfig config;
        config.grade_dir = root.path();
        config.submission_location = root.path() / "student";
        config.tests_location = root.path() / "tests";
        config.result_location = root.path() / "results" / "results.json";
        config.test_path = SearchPath{{config.tests_location}};
        config.sandbox = false;
        config.scratch_dir = root.path() / "scratch";
        return config;
    }

    nlohmann::json read_results() const {
        std::ifstream file{root.path() / "results" / "results.json"};
        return nlohmann::json::parse(file);
    }
};

} // namespace

TEST_CASE("Stage transitions are strictly linear") {
    REQUIRE(GradingPipeline::is_valid_transition(Stage::Init, Stage::Built));
    REQUIRE(GradingPipeline::is_valid_transition(Stage::Init, Stage::BuildFailed));
    REQUIRE(GradingPipeline::is_valid_transition(Stage::Init, Stage::Ungradable));
    REQUIRE(GradingPipeline::is_valid_transition(Stage::Built, Stage::TestsRun));
    REQUIRE(GradingPipeline::is_valid_transition(Stage::BuildFailed, Stage::Aggregated));
    REQUIRE(GradingPipeline::is_valid_transition(Stage::TestsRun, Stage::Aggregated));
    REQUIRE(GradingPipeline::is_valid_transition(Stage::Aggregated, Stage::Persisted));

    REQUIRE_FALSE(GradingPipeline::is_valid_transition(Stage::Init, Stage::TestsRun));
    REQUIRE_FALSE(GradingPipeline::is_valid_transition(Stage::BuildFailed, Stage::TestsRun));
    REQUIRE_FALSE(GradingPipeline::is_valid_transition(Stage::Built, Stage::Aggregated));
    REQUIRE_FALSE(GradingPipeline::is_valid_transition(Stage::Persisted, Stage::Init));
}

TEST_CASE("Grade an interpreted submission end to end") {
    GradeDir grade;
    grade.root.write_file("student/main.sh", "read n; echo $((n * 2))\n");
    grade.root.write_file("tests/tests.json", R"({
        "defaults": {"command": ["/bin/sh", "{submission}/main.sh"]},
        "tests": [
            {"name": "doubles", "stdin": "21\n", "expect": {"stdout": "42"}},
            {"name": "doubles zero", "stdin": "0\n", "expect": {"stdout": "1"}, "hidden": true, "max_points": 2}
        ]
    })");

    HarnessConfig config = grade.config();
    NullSink sink;
    RecordingSerializer serializer{sink};
    GradingPipeline pipeline{config, unsandboxed, &serializer};

    Report report = pipeline.run();

    REQUIRE(pipeline.get_stage() == Stage::Persisted);
    REQUIRE(report.status == OverallStatus::Failed);
    REQUIRE(report.points == 1.0);
    REQUIRE(report.max_points == 3.0);

    REQUIRE(serializer.events ==
            std::vector<std::string>{"metadata", "build ok", "test doubles", "test doubles zero", "report"});

    nlohmann::json results = grade.read_results();
    REQUIRE(results.at("status") == "failed");
    REQUIRE(results.at("tests").at(0).at("name") == "doubles");
    REQUIRE(results.at("tests").at(0).at("status") == "passed");
    REQUIRE(results.at("tests").at(1).at("name") == "Hidden test 1");
    REQUIRE(results.at("tests").at(1).at("status") == "failed");
}

TEST_CASE("A build failure runs no tests") {
    GradeDir grade;
    grade.root.write_file("tests/gradebox.json", R"({
        "language": "compiled",
        "build": {"command": "echo 'main.c:1: error: unknown type name' >&2; exit 1"}
    })");
    grade.root.write_file("tests/tests.json", R"({
        "tests": [
            {"name": "would leave a trace", "command": "touch {submission}/ran", "max_points": 3},
            {"name": "also", "command": "touch {submission}/ran", "max_points": 2}
        ]
    })");

    HarnessConfig config = grade.config();
    GradingPipeline pipeline{config, unsandboxed, nullptr};

    Report report = pipeline.run();

    REQUIRE(report.status == OverallStatus::BuildError);
    REQUIRE(report.max_points == 5.0);
    REQUIRE(report.score == 0.0);
    REQUIRE(report.tests.size() == 1);
    REQUIRE_THAT(report.output, ContainsSubstring("main.c:1: error: unknown type name"));
    REQUIRE_FALSE(fs::exists(grade.root.path() / "student" / "ran"));

    REQUIRE(grade.read_results().at("status") == "build-error");
}

TEST_CASE("A broken suite is reported as ungradable") {
    GradeDir grade;
    grade.root.write_file("tests/tests.json", R"({"tests": [{"name": "no command"}]})");

    HarnessConfig config = grade.config();
    NullSink sink;
    RecordingSerializer serializer{sink};
    GradingPipeline pipeline{config, unsandboxed, &serializer};

    Report report = pipeline.run();

    REQUIRE(pipeline.get_stage() == Stage::Persisted);
    REQUIRE_FALSE(report.gradable);
    REQUIRE(report.status == OverallStatus::Ungradable);
    REQUIRE(serializer.events.at(1).starts_with("error Invalid test suite"));

    nlohmann::json results = grade.read_results();
    REQUIRE(results.at("gradable") == false);
    REQUIRE(results.at("status") == "ungradable");
    REQUIRE_THAT(results.at("output").get<std::string>(), ContainsSubstring("\"command\" is required"));
}
