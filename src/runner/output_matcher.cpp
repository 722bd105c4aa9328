#include "runner/output_matcher.hpp"

#include "subprocess/run_result.hpp"

#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/view/remove_if.hpp>

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

namespace {

bool is_space(char chr) {
    return std::isspace(static_cast<unsigned char>(chr)) != 0;
}

void add_check(MatchResult& result, std::string_view what, bool correct) {
    result.checks.push_back({.label = std::string{what}, .correct = correct});
}

} // namespace

std::string CheckVerdict::to_string() const {
    return fmt::format("{}: {}", label, correct ? "Correct" : "Mismatch");
}

bool MatchResult::passed() const {
    return ranges::all_of(checks, &CheckVerdict::correct);
}

std::string MatchResult::verdicts() const {
    std::string result;

    for (const CheckVerdict& check : checks) {
        result += check.to_string();
        result += '\n';
    }

    return result;
}

bool outputs_match(std::string_view expected, std::string_view actual, bool ignore_whitespace) {
    if (!ignore_whitespace) {
        return expected == actual;
    }

    return ranges::equal(expected | ranges::views::remove_if(is_space), actual | ranges::views::remove_if(is_space));
}

MatchResult match_expectation(const Expectation& expected, const CapturedRun& run) {
    MatchResult result;

    if (expected.exit_code) {
        add_check(result, "Return Code", run.result.exited_with(*expected.exit_code));
    }

    if (expected.stdout_text) {
        add_check(result, "Output", outputs_match(*expected.stdout_text, run.stdout_text, expected.ignore_whitespace));
    }

    if (expected.stderr_text) {
        add_check(result, "Standard Error",
                  outputs_match(*expected.stderr_text, run.stderr_text, expected.ignore_whitespace));
    }

    return result;
}

std::string describe_expectation(const Expectation& expected) {
    std::string result;

    if (expected.exit_code) {
        result += fmt::format("Expected Return Code: {}\n", *expected.exit_code);
    }

    if (expected.stdout_text && !expected.stdout_text->empty()) {
        result += fmt::format("Expected Output: {}\n", *expected.stdout_text);
    }

    if (expected.stderr_text && !expected.stderr_text->empty()) {
        result += fmt::format("Expected Error: {}\n", *expected.stderr_text);
    }

    return result;
}

std::string describe_invocation(const std::vector<std::string>& argv, const std::optional<std::string>& stdin_data) {
    std::string result = fmt::format("Your program was run as: {}", shell_join(argv));

    if (stdin_data) {
        result += fmt::format("\nIt was provided the following input: {}", *stdin_data);
    }

    return result;
}

std::string shell_join(const std::vector<std::string>& argv) {
    auto needs_quotes = [](const std::string& arg) {
        if (arg.empty()) {
            return true;
        }
        return ranges::find_if(arg, [](char chr) {
                   return !(std::isalnum(static_cast<unsigned char>(chr)) != 0 ||
                            std::string_view{"@%+=:,./-_"}.find(chr) != std::string_view::npos);
               }) != arg.end();
    };

    std::string result;

    for (const std::string& arg : argv) {
        if (!result.empty()) {
            result += ' ';
        }

        if (!needs_quotes(arg)) {
            result += arg;
            continue;
        }

        // 'it'"'"'s'
        result += '\'';
        for (char chr : arg) {
            if (chr == '\'') {
                result += R"('"'"')";
            } else {
                result += chr;
            }
        }
        result += '\'';
    }

    return result;
}

} // namespace gradebox
