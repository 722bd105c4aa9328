#pragma once

#include <gradebox/common/expected.hpp>

#include "sandbox/privilege_separator.hpp"
#include "suite/search_path.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace gradebox {

/// Where everything lives and how tests are run, resolved from the environment of the container
struct HarnessConfig
{
    std::filesystem::path result_location = "/grade/results/results.json";
    std::filesystem::path tests_location = "/grade/tests";

    /// Fixture and helper lookup order
    SearchPath test_path;

    std::filesystem::path grade_dir = "/grade";
    std::filesystem::path submission_location = "/grade/student";

    /// Off only if explicitly requested
    bool sandbox = true;
    std::string sandbox_user = "sbuser";

    std::size_t jobs = 1;
    std::size_t max_output = 64 * 1024;

    std::filesystem::path scratch_dir = "/tmp/gradebox";

    using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

    /// Reads the GRADEBOX_* variables (and GRADE_DIR). Unset variables keep their defaults; malformed
    /// ones are an error
    static Expected<HarnessConfig, std::string> from_environment(const EnvironmentLookup& lookup);

    /// ``from_environment`` over the process environment
    static Expected<HarnessConfig, std::string> from_environment();

    /// Verify that the configured directories exist
    Expected<void, std::string> validate() const;

    /// The directories the privilege separator adjusts
    SandboxLayout make_sandbox_layout() const;
};

/// ``on``/``off`` style switch
Expected<bool, std::string> parse_switch(std::string_view name, std::string_view value);

/// Positive integer, e.g. GRADEBOX_JOBS
Expected<std::size_t, std::string> parse_positive(std::string_view name, std::string_view value);

} // namespace gradebox

template <>
struct fmt::formatter<::gradebox::HarnessConfig> : fmt::formatter<std::string>
{
    auto format(const ::gradebox::HarnessConfig& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{result={:?}, tests={:?}, test_path={:?}, submission={:?}, sandbox={} ({}), jobs={}, "
                              "max_output={}, scratch={:?}}}",
                              from.result_location.string(), from.tests_location.string(), from.test_path.to_string(),
                              from.submission_location.string(), from.sandbox, from.sandbox_user, from.jobs,
                              from.max_output, from.scratch_dir.string());
    }
};
