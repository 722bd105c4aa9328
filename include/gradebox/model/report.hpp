/// \file
/// Data classes describing the outcome of a whole grading run
#pragma once

#include <gradebox/common/formatters.hpp>
#include <gradebox/model/test_outcome.hpp>
#include <gradebox/version.hpp>

#include <boost/describe/enum.hpp>
#include <gsl/util>
#include <range/v3/algorithm/count_if.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

// NOLINTNEXTLINE
enum class OverallStatus {
    Passed,     ///< No test failed, errored or timed out
    Failed,     ///< At least one test did not pass
    BuildError, ///< The submission did not build; no tests ran
    Ungradable  ///< The suite or its configuration is broken; the submission was not judged
};

BOOST_DESCRIBE_ENUM(OverallStatus, Passed, Failed, BuildError, Ungradable);

constexpr std::string_view to_wire_string(OverallStatus status) {
    using enum OverallStatus;

    switch (status) {
    case Passed:
        return "passed";
    case Failed:
        return "failed";
    case BuildError:
        return "build-error";
    case Ungradable:
        return "ungradable";
    }

    return "ungradable";
}

struct RunMetadata
{
    std::string_view version_string = GRADEBOX_VERSION_STRING;

    std::chrono::time_point<std::chrono::system_clock> start_time = std::chrono::system_clock::now();
};

/// The sole durable output of a run
struct Report
{
    static constexpr int SCHEMA_VERSION = 1;

    bool gradable = true;
    OverallStatus status = OverallStatus::Passed;

    /// Declaration order
    std::vector<TestOutcome> tests;

    double points = 0.0;
    double max_points = 0.0;

    /// points / max_points, clamped by the scoring policy
    double score = 0.0;

    std::string message;
    std::string output;

    int num_passed() const noexcept {
        return gsl::narrow_cast<int>(ranges::count_if(tests, &TestOutcome::passed));
    }

    int num_unsuccessful() const noexcept {
        return gsl::narrow_cast<int>(ranges::count_if(tests, &TestOutcome::unsuccessful));
    }
};

} // namespace gradebox
