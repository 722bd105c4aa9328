#include "pipeline/grading_pipeline.hpp"

#include <gradebox/exceptions.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/model/build_result.hpp>
#include <gradebox/model/report.hpp>

#include "build/build_adapter.hpp"
#include "report/aggregator.hpp"
#include "report/report_writer.hpp"
#include "runner/test_runner.hpp"
#include "suite/suite_loader.hpp"

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/any_of.hpp>

#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace gradebox {

namespace fs = std::filesystem;

namespace {

/// What the suite would have been worth; the synthetic build-error outcome carries it
double total_max_points(const TestSuite& suite) {
    double total = 0.0;

    for (const TestCase& test : suite.tests) {
        if (test.include_in_results) {
            total += test.max_points;
        }
    }

    return total;
}

} // namespace

GradingPipeline::GradingPipeline(const HarnessConfig& config, const SandboxedExecutor& executor,
                                 Serializer* serializer)
    : config_{&config}
    , executor_{&executor}
    , serializer_{serializer} {}

bool GradingPipeline::is_valid_transition(Stage from, Stage to) {
    using enum Stage;

    switch (from) {
    case Init:
        return to == Built || to == BuildFailed || to == Ungradable;
    case Built:
        return to == TestsRun;
    case BuildFailed:
    case Ungradable:
    case TestsRun:
        return to == Aggregated;
    case Aggregated:
        return to == Persisted;
    case Persisted:
        return false;
    }

    return false;
}

void GradingPipeline::advance(Stage next) {
    ASSERT(is_valid_transition(stage_, next), stage_, next);

    LOG_DEBUG("Pipeline: {} -> {}", stage_, next);
    stage_ = next;
}

Report GradingPipeline::run() {
    ASSERT(stage_ == Stage::Init, "a pipeline runs once", stage_);

    if (serializer_ != nullptr) {
        serializer_->on_run_metadata(RunMetadata{});
    }

    Report report;

    if (std::optional<TestSuite> suite = load_suite(report)) {
        if (suite->profile.memory_check.enabled ||
            ranges::any_of(suite->tests, [](const TestCase& test) { return test.memory_check.value_or(false); })) {
            std::error_code err;
            fs::create_directories(config_->scratch_dir, err);
            if (err) {
                LOG_WARN("Could not create scratch directory {:?}: {}", config_->scratch_dir.string(), err.message());
            }
        }

        BuildAdapter builder{*executor_, config_->max_output};
        BuildResult build = builder.build(config_->submission_location, suite->profile);

        if (serializer_ != nullptr) {
            serializer_->on_build_result(build);
        }

        report = run_suite(*suite, build);
    }

    advance(Stage::Aggregated);

    if (serializer_ != nullptr) {
        for (const TestOutcome& outcome : report.tests) {
            serializer_->on_test_result(outcome);
        }
        serializer_->on_report(report);
    }

    ReportWriter writer{config_->result_location};
    writer.write(report);

    advance(Stage::Persisted);

    return report;
}

std::optional<TestSuite> GradingPipeline::load_suite(Report& report) {
    SuiteLoader loader{config_->tests_location, config_->test_path};

    try {
        return loader.load();
    } catch (const SuiteError& ex) {
        LOG_ERROR("Invalid test suite: {}", ex.what());

        if (serializer_ != nullptr) {
            serializer_->on_error(fmt::format("Invalid test suite: {}", ex.what()));
        }

        report = ResultAggregator::make_ungradable(ex.what());
        advance(Stage::Ungradable);
    }

    return std::nullopt;
}

Report GradingPipeline::run_suite(const TestSuite& suite, const BuildResult& build) {
    ResultAggregator aggregator{suite.scoring};

    if (!build.succeeded()) {
        LOG_WARN("Build failed; skipping all {} tests", suite.tests.size());
        advance(Stage::BuildFailed);

        return aggregator.aggregate_build_failure(build, total_max_points(suite));
    }

    advance(Stage::Built);

    TestRunner runner{*executor_,
                      {.submission_dir = config_->submission_location,
                       .tests_dir = config_->tests_location,
                       .scratch_dir = config_->scratch_dir,
                       .jobs = config_->jobs,
                       .max_output = config_->max_output}};

    std::vector<TestOutcome> outcomes = runner.run(suite, build.get_artifact());
    advance(Stage::TestsRun);

    return aggregator.aggregate(std::move(outcomes));
}

} // namespace gradebox
