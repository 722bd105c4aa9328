#pragma once

#include <gradebox/model/test_case.hpp>
#include <gradebox/model/test_outcome.hpp>

#include "runner/memory_checker.hpp"
#include "runner/output_matcher.hpp"
#include "sandbox/sandboxed_executor.hpp"
#include "subprocess/run_result.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

struct RunnerOptions
{
    std::filesystem::path submission_dir;
    std::filesystem::path tests_dir;

    /// Where memory checker logs go
    std::filesystem::path scratch_dir;

    /// Worker pool size; 1 runs the suite sequentially
    std::size_t jobs = 1;

    /// Per-stream capture cap
    std::size_t max_output = 64 * 1024;
};

/// Values substituted into ``{artifact}``, ``{submission}`` and ``{tests}``
struct Placeholders
{
    std::string artifact;
    std::string submission;
    std::string tests;

    std::string expand(std::string_view text) const;
};

/// Executes a suite test by test, each in its own process group, and judges the results.
///
/// Outcomes are returned in declaration order no matter how many workers ran them. A crash, timeout
/// or engine-side error in one test only ever affects that test's outcome.
class TestRunner
{
public:
    TestRunner(const SandboxedExecutor& executor, RunnerOptions options);

    std::vector<TestOutcome> run(const TestSuite& suite, const std::filesystem::path& artifact) const;

    /// Never throws for problems with the test itself; those become errored / timed-out outcomes
    TestOutcome run_one(const TestCase& test, const TestSuite& suite, const Placeholders& placeholders,
                        MemoryChecker* memory_checker) const;

    const RunnerOptions& get_options() const { return options_; }

private:
    /// A TestCase with placeholders expanded and the reference program (if any) already run
    struct PreparedTest
    {
        std::vector<std::string> argv;
        std::filesystem::path cwd;
        std::map<std::string, std::string> env;
        Expectation expected;
        std::size_t max_output;
    };

    /// Throws TestExecutionError if the reference program cannot produce an expectation
    PreparedTest prepare(const TestCase& test, const Placeholders& placeholders) const;

    /// Throws TestExecutionError when the program could not be started under the sandbox
    CapturedRun execute(const TestCase& test, const PreparedTest& prepared, const std::vector<std::string>& argv) const;

    /// Fills in status and output. Throws TestTimeoutError (whose message is the full output text)
    /// if the run hit its deadline
    void judge(const TestCase& test, const PreparedTest& prepared, const CapturedRun& run,
               const std::optional<std::string>& memory_violation, TestOutcome& outcome) const;

    const SandboxedExecutor* executor_;
    RunnerOptions options_;
};

/// Feedback text for a finished run: a headline (verdicts, "Your Program Crashed", ...), then the exit
/// status and streams. Everything is shown if the program did not exit cleanly, otherwise only what
/// was checked.
std::string build_program_output(std::string_view headline, const Expectation& expected, const CapturedRun& run);

} // namespace gradebox
