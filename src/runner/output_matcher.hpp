#pragma once

#include <gradebox/model/test_case.hpp>

#include "subprocess/run_result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

/// Outcome of one expectation check, e.g. "Output: Mismatch"
struct CheckVerdict
{
    std::string label;
    bool correct;

    std::string to_string() const;
};

struct MatchResult
{
    std::vector<CheckVerdict> checks;

    /// True when every check was correct (vacuously true without checks)
    bool passed() const;

    /// One verdict per line
    std::string verdicts() const;
};

/// Compares program text. With ``ignore_whitespace`` every whitespace character is disregarded,
/// so "1 2\n" matches "12"
bool outputs_match(std::string_view expected, std::string_view actual, bool ignore_whitespace);

/// Check the exit code, stdout and stderr of ``run`` against ``expected``.
/// Only fields set in ``expected`` are checked. A program killed by a signal never matches an
/// expected exit code.
MatchResult match_expectation(const Expectation& expected, const CapturedRun& run);

/// Expectation lines for the outcome message ("Expected Return Code: 0", ...)
std::string describe_expectation(const Expectation& expected);

/// "Your program was run as: ..." plus the stdin that was provided, if any
std::string describe_invocation(const std::vector<std::string>& argv, const std::optional<std::string>& stdin_data);

/// Shell-style quoting, so the printed command can be pasted into a terminal
std::string shell_join(const std::vector<std::string>& argv);

} // namespace gradebox
