#pragma once

#include <gradebox/model/test_outcome.hpp>

namespace gradebox {

/// How non-passing outcomes are credited and how the final score fraction is clamped.
/// All credit fractions default to zero: only passing tests earn points.
struct ScoringPolicy
{
    double failed_credit = 0.0;
    double errored_credit = 0.0;
    double timed_out_credit = 0.0;

    /// Subtract a test's ``points_lost_on_failure`` when it does not pass
    bool apply_penalties = true;

    double score_floor = 0.0;
    double score_ceiling = 1.0;

    /// Fraction of a test's max points awarded for ``status``
    constexpr double credit_for(TestStatus status) const noexcept {
        using enum TestStatus;

        switch (status) {
        case Passed:
            return 1.0;
        case Failed:
            return failed_credit;
        case Errored:
            return errored_credit;
        case TimedOut:
            return timed_out_credit;
        case Skipped:
        case BuildError:
            return 0.0;
        }

        return 0.0;
    }

    /// Points a test worth ``max_points`` earns for ``status``, after its failure penalty.
    /// May be negative when the penalty outweighs the credit; the report's score is clamped instead
    constexpr double points_for(TestStatus status, double max_points, double penalty) const noexcept {
        using enum TestStatus;

        double points = credit_for(status) * max_points;

        if (apply_penalties && (status == Failed || status == Errored || status == TimedOut)) {
            points -= penalty;
        }

        return points;
    }
};

} // namespace gradebox
