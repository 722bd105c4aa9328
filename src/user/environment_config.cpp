#include "user/environment_config.hpp"

#include <gradebox/common/error_types.hpp>
#include <gradebox/logging.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace gradebox {

namespace fs = std::filesystem;

namespace {

Expected<void, std::string> ensure_is_directory(const fs::path& path, std::string_view what) {
    std::error_code err;

    if (!fs::exists(path, err)) {
        return fmt::format("{} {:?} does not exist", what, path.string());
    }

    if (!fs::is_directory(path, err)) {
        return fmt::format("{} {:?} is not a directory", what, path.string());
    }

    return {};
}

} // namespace

Expected<bool, std::string> parse_switch(std::string_view name, std::string_view value) {
    if (value == "on" || value == "1" || value == "true" || value == "yes") {
        return true;
    }

    if (value == "off" || value == "0" || value == "false" || value == "no") {
        return false;
    }

    return fmt::format("{} must be \"on\" or \"off\" (got {:?})", name, value);
}

Expected<std::size_t, std::string> parse_positive(std::string_view name, std::string_view value) {
    std::size_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);

    if (ec != std::errc{} || ptr != value.data() + value.size() || result == 0) {
        return fmt::format("{} must be a positive integer (got {:?})", name, value);
    }

    return result;
}

Expected<HarnessConfig, std::string> HarnessConfig::from_environment(const EnvironmentLookup& lookup) {
    HarnessConfig config;

    // Empty values count as unset
    auto get = [&lookup](const std::string& name) -> std::optional<std::string> {
        std::optional<std::string> value = lookup(name);
        if (value && value->empty()) {
            return std::nullopt;
        }
        return value;
    };

    if (auto grade_dir = get("GRADE_DIR")) {
        config.grade_dir = *grade_dir;
    }

    config.submission_location = get("GRADEBOX_SUBMISSION_LOCATION").value_or((config.grade_dir / "student").string());

    config.result_location =
        get("GRADEBOX_RESULT_LOCATION").value_or((config.grade_dir / "results" / "results.json").string());
    config.tests_location = get("GRADEBOX_TESTS_LOCATION").value_or((config.grade_dir / "tests").string());

    if (auto test_path = get("GRADEBOX_TEST_PATH")) {
        config.test_path = SearchPath::parse(*test_path);
    } else {
        config.test_path = SearchPath{{config.tests_location, config.grade_dir / "serverFilesCourse"}};
    }

    if (auto sandbox = get("GRADEBOX_SANDBOX")) {
        config.sandbox = TRY(parse_switch("GRADEBOX_SANDBOX", *sandbox));
    }

    if (auto user = get("GRADEBOX_SANDBOX_USER")) {
        config.sandbox_user = *user;
    }

    if (auto jobs = get("GRADEBOX_JOBS")) {
        config.jobs = TRY(parse_positive("GRADEBOX_JOBS", *jobs));
    }

    if (auto max_output = get("GRADEBOX_MAX_OUTPUT")) {
        config.max_output = TRY(parse_positive("GRADEBOX_MAX_OUTPUT", *max_output));
    }

    if (auto scratch = get("GRADEBOX_SCRATCH_DIR")) {
        config.scratch_dir = *scratch;
    }

    if (config.result_location.filename().empty()) {
        return fmt::format("GRADEBOX_RESULT_LOCATION must name a file (got {:?})", config.result_location.string());
    }

    return config;
}

Expected<HarnessConfig, std::string> HarnessConfig::from_environment() {
    return from_environment([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string{value};
    });
}

Expected<void, std::string> HarnessConfig::validate() const {
    TRY(ensure_is_directory(tests_location, "Tests location"));
    TRY(ensure_is_directory(submission_location, "Submission directory"));

    std::error_code err;
    if (fs::is_directory(result_location, err)) {
        return fmt::format("Result location {:?} is a directory", result_location.string());
    }

    if (sandbox && sandbox_user.empty()) {
        return std::string{"GRADEBOX_SANDBOX_USER must not be empty"};
    }

    return {};
}

SandboxLayout HarnessConfig::make_sandbox_layout() const {
    std::vector<fs::path> fixture_dirs{tests_location};

    for (const fs::path& dir : test_path.get_dirs()) {
        if (dir != tests_location) {
            fixture_dirs.push_back(dir);
        }
    }

    return {.grade_root = grade_dir,
            .submission_dir = submission_location,
            .fixture_dirs = std::move(fixture_dirs),
            .results_dir = result_location.parent_path(),
            .scratch_dir = scratch_dir};
}

} // namespace gradebox
