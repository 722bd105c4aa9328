#include "report/aggregator.hpp"

#include <gradebox/logging.hpp>
#include <gradebox/model/build_result.hpp>
#include <gradebox/model/report.hpp>
#include <gradebox/model/test_outcome.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/numeric/accumulate.hpp>

#include <algorithm>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gradebox {

RunSummary& RunSummary::operator+=(const RunSummary& rhs) {
    num_available += rhs.num_available;
    num_ran += rhs.num_ran;
    num_passed += rhs.num_passed;
    points_earned += rhs.points_earned;
    points_available += rhs.points_available;

    return *this;
}

RunSummary RunSummary::of(const std::vector<TestOutcome>& outcomes, bool hidden) {
    RunSummary summary;

    for (const TestOutcome& outcome : outcomes) {
        // Unscored tests are reported individually but left out of every total
        if (!outcome.scored || outcome.hidden != hidden) {
            continue;
        }

        ++summary.num_available;
        summary.points_available += outcome.max_points;
        summary.points_earned += outcome.points;

        if (outcome.status != TestStatus::Skipped && outcome.status != TestStatus::BuildError) {
            ++summary.num_ran;
        }

        if (outcome.passed()) {
            ++summary.num_passed;
        }
    }

    return summary;
}

ResultAggregator::ResultAggregator(ScoringPolicy policy)
    : policy_{policy} {}

Report ResultAggregator::aggregate(std::vector<TestOutcome> outcomes) const {
    Report report;

    report.points = ranges::accumulate(outcomes, 0.0, std::plus<>{}, &TestOutcome::points);
    report.max_points = ranges::accumulate(outcomes, 0.0, std::plus<>{}, &TestOutcome::max_points);
    report.score = compute_score(report.points, report.max_points);

    const bool any_unsuccessful = ranges::any_of(outcomes, &TestOutcome::unsuccessful);
    report.status = any_unsuccessful ? OverallStatus::Failed : OverallStatus::Passed;

    report.message = summarize(outcomes, report.score);
    report.tests = std::move(outcomes);

    LOG_INFO("Aggregated {} outcomes: {}/{} points (score {:.4f}), status {}", report.tests.size(), report.points,
             report.max_points, report.score, report.status);

    return report;
}

Report ResultAggregator::aggregate_build_failure(const BuildResult& build, double max_points) const {
    TestOutcome synthetic{.name = "Build",
                          .description = "Compile the submission",
                          .status = TestStatus::BuildError,
                          .output = build.get_diagnostics(),
                          .message = "Your submission could not be built, so no tests were run.",
                          .points = 0.0,
                          .max_points = max_points};

    Report report;
    report.status = OverallStatus::BuildError;
    report.points = 0.0;
    report.max_points = max_points;
    report.score = compute_score(0.0, max_points);
    report.output = build.get_diagnostics();
    report.tests.push_back(std::move(synthetic));
    report.message = fmt::format("Build failed; no tests were run.\n{}", summarize(report.tests, report.score));

    return report;
}

Report ResultAggregator::make_ungradable(const std::string& reason) {
    Report report;

    report.gradable = false;
    report.status = OverallStatus::Ungradable;
    report.score = 0.0;
    report.message = "This submission could not be graded because of a problem with the tests. "
                     "Please contact your instructor.";
    report.output = reason;

    return report;
}

double ResultAggregator::compute_score(double points, double max_points) const {
    double score = max_points > 0.0 ? points / max_points : 0.0;

    score = std::max(policy_.score_floor, score);
    score = std::min(policy_.score_ceiling, score);

    return score;
}

std::string ResultAggregator::summarize(const std::vector<TestOutcome>& outcomes, double score) {
    const RunSummary visible = RunSummary::of(outcomes, /*hidden=*/false);
    const RunSummary hidden = RunSummary::of(outcomes, /*hidden=*/true);

    RunSummary total = visible;
    total += hidden;

    auto line = [](std::string_view label, const RunSummary& summary) {
        return fmt::format("{}: {} of {} tests run, {} passed, {:g} / {:g} points\n", label, summary.num_ran,
                           summary.num_available, summary.num_passed, summary.points_earned,
                           summary.points_available);
    };

    std::string result = line("Visible tests", visible);

    if (hidden.num_available > 0) {
        result += line("Hidden tests", hidden);
        result += line("All tests", total);
    }

    result += fmt::format("Final score: {:.2f}%\n", score * 100.0);

    return result;
}

} // namespace gradebox
