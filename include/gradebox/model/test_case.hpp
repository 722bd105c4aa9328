#pragma once

#include <gradebox/model/language_profile.hpp>
#include <gradebox/model/scoring_policy.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gradebox {

/// Predicate a test run is checked against. Unset fields are not checked
struct Expectation
{
    std::optional<int> exit_code;

    /// Already resolved from ``stdout`` or ``stdout_file``
    std::optional<std::string> stdout_text;
    std::optional<std::string> stderr_text;

    bool ignore_whitespace = true;

    /// Instructor program whose exit code and stdout become the expectation
    std::vector<std::string> reference_command;

    bool has_reference() const noexcept { return !reference_command.empty(); }
};

/// One instructor-defined test. Read-only once loaded
struct TestCase
{
    std::string name;
    std::string description;

    /// May contain ``{artifact}``, ``{submission}`` and ``{tests}`` placeholders
    std::vector<std::string> command;

    std::optional<std::string> stdin_data;

    /// Working directory; the submission directory if unset
    std::optional<std::filesystem::path> cwd;
    std::map<std::string, std::string> env;

    std::chrono::milliseconds timeout = std::chrono::seconds{10};

    double max_points = 1.0;
    double points_lost_on_failure = 0.0;

    bool hidden = false;
    bool include_in_results = true;

    /// Overrides the language profile's memory check setting
    std::optional<bool> memory_check;

    std::optional<std::string> skip_reason;

    Expectation expected;

    /// Manifest the case was declared in
    std::filesystem::path origin;
};

/// The full instructor suite, in declaration order
struct TestSuite
{
    std::vector<TestCase> tests;
    LanguageProfile profile;
    ScoringPolicy scoring;
};

} // namespace gradebox
