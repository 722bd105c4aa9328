#pragma once

#include <gradebox/model/build_result.hpp>
#include <gradebox/model/report.hpp>
#include <gradebox/model/scoring_policy.hpp>
#include <gradebox/model/test_outcome.hpp>

#include <string>
#include <vector>

namespace gradebox {

/// Counts for one group of tests (visible or hidden) in the summary message
struct RunSummary
{
    int num_available = 0;
    int num_ran = 0;
    int num_passed = 0;

    double points_earned = 0.0;
    double points_available = 0.0;

    RunSummary& operator+=(const RunSummary& rhs);

    static RunSummary of(const std::vector<TestOutcome>& outcomes, bool hidden);
};

/// Builds the Report out of per-test outcomes. Deterministic: the same outcomes always give the
/// same Report
class ResultAggregator
{
public:
    explicit ResultAggregator(ScoringPolicy policy);

    Report aggregate(std::vector<TestOutcome> outcomes) const;

    /// A single zero-score build-error outcome worth ``max_points`` (the total the suite would have been
    /// worth), carrying the toolchain diagnostics
    Report aggregate_build_failure(const BuildResult& build, double max_points) const;

    /// The suite itself is broken; nothing about the submission was judged
    static Report make_ungradable(const std::string& reason);

    /// points / max_points (0 for an empty suite), clamped to the policy's floor and ceiling
    double compute_score(double points, double max_points) const;

    static std::string summarize(const std::vector<TestOutcome>& outcomes, double score);

private:
    ScoringPolicy policy_;
};

} // namespace gradebox
