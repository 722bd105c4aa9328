#pragma once

#include <gradebox/common/formatters.hpp>
#include <gradebox/model/build_result.hpp>
#include <gradebox/model/report.hpp>
#include <gradebox/model/test_case.hpp>

#include "output/serializer.hpp"
#include "sandbox/sandboxed_executor.hpp"
#include "user/environment_config.hpp"

#include <boost/describe/enum.hpp>

#include <optional>

namespace gradebox {

/// Drives one submission through the strictly linear grading flow:
///
///   Init -> Built       -> TestsRun -> Aggregated -> Persisted
///        -> BuildFailed ------------> Aggregated -> Persisted
///        -> Ungradable -------------> Aggregated -> Persisted
///
/// Privilege separation has already happened by the time a pipeline exists; it is handed the executor
/// that launches submission code under the restricted identity.
class GradingPipeline
{
public:
    // NOLINTNEXTLINE
    enum class Stage { Init, Built, BuildFailed, Ungradable, TestsRun, Aggregated, Persisted };
    BOOST_DESCRIBE_NESTED_ENUM(Stage, Init, Built, BuildFailed, Ungradable, TestsRun, Aggregated, Persisted)

    /// ``serializer`` may be null (no console output)
    GradingPipeline(const HarnessConfig& config, const SandboxedExecutor& executor, Serializer* serializer);

    /// Runs every stage and writes the result file. Only ResultPersistenceError escapes; build
    /// failures, broken suites and per-test problems all end up in the returned Report
    Report run();

    Stage get_stage() const { return stage_; }

    static bool is_valid_transition(Stage from, Stage to);

private:
    void advance(Stage next);

    /// Nullopt (and stage Ungradable) if the suite is invalid
    std::optional<TestSuite> load_suite(Report& report);

    Report run_suite(const TestSuite& suite, const BuildResult& build);

    const HarnessConfig* config_;
    const SandboxedExecutor* executor_;
    Serializer* serializer_;

    Stage stage_ = Stage::Init;
};

} // namespace gradebox
