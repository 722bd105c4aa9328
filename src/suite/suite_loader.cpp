#include "suite/suite_loader.hpp"

#include <gradebox/common/formatters.hpp>
#include <gradebox/exceptions.hpp>
#include <gradebox/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace gradebox {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

using StringList = std::vector<std::string>;
using StringMap = std::map<std::string, std::string>;

/// Longest timeout a suite may ask for, build or test
constexpr double MAX_TIMEOUT_SECONDS = 24.0 * 60 * 60;

/// Whether an integral ``value`` lies within [lo, hi]. Non-negative JSON integers are stored unsigned.
bool integer_within(const json& value, std::int64_t lo, std::int64_t hi) {
    if (value.is_number_unsigned()) {
        const auto num = value.get<std::uint64_t>();
        return hi >= 0 && num <= static_cast<std::uint64_t>(hi) && (lo <= 0 || num >= static_cast<std::uint64_t>(lo));
    }

    const auto num = value.get<std::int64_t>();
    return num >= lo && num <= hi;
}

template <typename T>
bool holds(const json& value) {
    if constexpr (std::is_same_v<T, std::string>) {
        return value.is_string();
    } else if constexpr (std::is_same_v<T, bool>) {
        return value.is_boolean();
    } else if constexpr (std::is_same_v<T, int>) {
        return value.is_number_integer() &&
               integer_within(value, std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
    } else if constexpr (std::is_same_v<T, double>) {
        return value.is_number();
    } else if constexpr (std::is_same_v<T, StringList>) {
        return value.is_array() &&
               std::all_of(value.begin(), value.end(), [](const json& elem) { return elem.is_string(); });
    } else if constexpr (std::is_same_v<T, StringMap>) {
        return value.is_object() &&
               std::all_of(value.begin(), value.end(), [](const json& elem) { return elem.is_string(); });
    } else {
        static_assert(!sizeof(T), "unsupported field type");
    }
}

template <typename T>
constexpr std::string_view type_description() {
    if constexpr (std::is_same_v<T, std::string>) {
        return "a string";
    } else if constexpr (std::is_same_v<T, bool>) {
        return "a boolean";
    } else if constexpr (std::is_same_v<T, int>) {
        return "an integer that fits in 32 bits";
    } else if constexpr (std::is_same_v<T, double>) {
        return "a number";
    } else if constexpr (std::is_same_v<T, StringList>) {
        return "an array of strings";
    } else {
        return "an object of strings";
    }
}

/// Leaves ``out`` untouched if ``key`` is absent
template <typename T>
ParseResult<void> read_field(const json& obj, const char* key, T& out) {
    auto iter = obj.find(key);
    if (iter == obj.end()) {
        return {};
    }

    if (!holds<T>(*iter)) {
        return fmt::format("\"{}\" must be {}", key, type_description<T>());
    }

    out = iter->template get<T>();
    return {};
}

template <typename T>
ParseResult<void> read_field(const json& obj, const char* key, std::optional<T>& out) {
    T value{};
    if (!obj.contains(key)) {
        return {};
    }

    TRY(read_field(obj, key, value));
    out = std::move(value);

    return {};
}

ParseResult<void> read_non_negative(const json& obj, const char* key, double& out) {
    TRY(read_field(obj, key, out));

    if (out < 0.0) {
        return fmt::format("\"{}\" must not be negative (got {})", key, out);
    }

    return {};
}

ParseResult<void> read_fraction(const json& obj, const char* key, double& out) {
    TRY(read_field(obj, key, out));

    if (out < 0.0 || out > 1.0) {
        return fmt::format("\"{}\" must be within [0, 1] (got {})", key, out);
    }

    return {};
}

/// Leaves ``out`` untouched if ``key`` is absent
template <typename T>
ParseResult<void> read_int_within(const json& obj, const char* key, int lo, int hi, T& out) {
    auto iter = obj.find(key);
    if (iter == obj.end()) {
        return {};
    }

    if (!iter->is_number_integer() || !integer_within(*iter, lo, hi)) {
        return fmt::format("\"{}\" must be an integer within [{}, {}] (got {})", key, lo, hi, iter->dump());
    }

    out = iter->template get<int>();
    return {};
}

/// Seconds in the document, milliseconds in the model
ParseResult<void> read_timeout(const json& obj, const char* key, std::chrono::milliseconds& out) {
    if (!obj.contains(key)) {
        return {};
    }

    double seconds = 0.0;
    TRY(read_field(obj, key, seconds));

    if (seconds <= 0.0) {
        return fmt::format("\"{}\" must be a positive number of seconds (got {})", key, seconds);
    }

    // Also rejects infinity, which a large enough literal parses to
    if (!(seconds <= MAX_TIMEOUT_SECONDS)) {
        return fmt::format("\"{}\" must not exceed {} seconds (got {})", key, MAX_TIMEOUT_SECONDS, seconds);
    }

    out = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double>{seconds});
    return {};
}

/// A command is either an argv array, or a string handed to ``/bin/sh -c``
ParseResult<void> read_command(const json& obj, const char* key, StringList& out) {
    auto iter = obj.find(key);
    if (iter == obj.end()) {
        return {};
    }

    if (iter->is_string()) {
        out = {"/bin/sh", "-c", iter->get<std::string>()};
    } else if (holds<StringList>(*iter)) {
        out = iter->get<StringList>();
    } else {
        return fmt::format("\"{}\" must be a string or an array of strings", key);
    }

    if (out.empty() || out.front().empty()) {
        return fmt::format("\"{}\" must not be empty", key);
    }

    return {};
}

ParseResult<void> check_object(const json& value, std::string_view what) {
    if (!value.is_object()) {
        return fmt::format("{} must be a JSON object", what);
    }
    return {};
}

ParseResult<void> reject_unknown_keys(const json& obj, std::initializer_list<std::string_view> known,
                                      std::string_view what) {
    for (const auto& item : obj.items()) {
        if (ranges::find(known, std::string_view{item.key()}) == known.end()) {
            return fmt::format("unknown key \"{}\" in {} (expected one of: {})", item.key(), what,
                               fmt::join(known, ", "));
        }
    }

    return {};
}

ParseResult<void> parse_memory_check(const json& value, MemoryCheckConfig& out) {
    if (value.is_boolean()) {
        out.enabled = value.get<bool>();
        return {};
    }

    TRY(check_object(value, "\"memory_check\""));
    TRY(reject_unknown_keys(value, {"enabled", "tool", "args", "error_exit_code"}, "\"memory_check\""));

    // An object without "enabled" turns checking on
    out.enabled = true;
    TRY(read_field(value, "enabled", out.enabled));
    TRY(read_field(value, "tool", out.tool));
    TRY(read_field(value, "args", out.tool_args));
    TRY(read_int_within(value, "error_exit_code", 1, 255, out.error_exit_code));

    if (out.tool.empty()) {
        return std::string{"\"memory_check.tool\" must not be empty"};
    }

    return {};
}

ParseResult<void> parse_build_section(const json& build, LanguageProfile& profile) {
    TRY(check_object(build, "\"build\""));
    TRY(reject_unknown_keys(build, {"compiler", "target", "flags", "sources", "output", "command", "timeout"},
                            "\"build\""));

    TRY(read_field(build, "compiler", profile.compiler));
    TRY(read_field(build, "flags", profile.flags));
    TRY(read_field(build, "sources", profile.source_extensions));
    TRY(read_field(build, "output", profile.output));
    TRY(read_command(build, "command", profile.command));
    TRY(read_timeout(build, "timeout", profile.build_timeout));

    if (auto iter = build.find("target"); iter != build.end()) {
        static const std::map<std::string, TargetArch, std::less<>> targets = {
            {"native", TargetArch::Native}, {"32", TargetArch::Bits32}, {"64", TargetArch::Bits64}};

        // 32 and 64 may also be spelled as numbers
        std::string target = iter->is_number_integer() ? std::to_string(iter->get<int>()) : std::string{};
        if (iter->is_string()) {
            target = iter->get<std::string>();
        }

        auto found = targets.find(target);
        if (found == targets.end()) {
            return std::string{R"("build.target" must be one of "native", "32" or "64")"};
        }
        profile.target = found->second;
    }

    if (profile.output.empty() || fs::path{profile.output}.is_absolute()) {
        return fmt::format("\"build.output\" must be a relative file name (got {:?})", profile.output);
    }

    if (profile.command.empty() && profile.compiler.empty()) {
        return std::string{"\"build.compiler\" must not be empty"};
    }

    return {};
}

ParseResult<void> parse_expectation(const json& expect, Expectation& out, std::optional<std::string>& stdout_file,
                                    std::optional<std::string>& stderr_file) {
    TRY(check_object(expect, "\"expect\""));
    TRY(reject_unknown_keys(expect,
                            {"exit_code", "stdout", "stdout_file", "stderr", "stderr_file", "ignore_whitespace",
                             "reference_command"},
                            "\"expect\""));

    TRY(read_int_within(expect, "exit_code", 0, 255, out.exit_code));
    TRY(read_field(expect, "stdout", out.stdout_text));
    TRY(read_field(expect, "stderr", out.stderr_text));
    TRY(read_field(expect, "stdout_file", stdout_file));
    TRY(read_field(expect, "stderr_file", stderr_file));
    TRY(read_field(expect, "ignore_whitespace", out.ignore_whitespace));
    TRY(read_command(expect, "reference_command", out.reference_command));

    if (out.stdout_text && stdout_file) {
        return std::string{R"("stdout" and "stdout_file" are mutually exclusive)"};
    }

    if (out.stderr_text && stderr_file) {
        return std::string{R"("stderr" and "stderr_file" are mutually exclusive)"};
    }

    if (out.has_reference() && (out.exit_code || out.stdout_text || stdout_file)) {
        return std::string{R"("reference_command" replaces "exit_code" and "stdout"; do not combine them)"};
    }

    return {};
}

std::string describe_case(std::size_t index, const json& entry) {
    if (auto iter = entry.find("name"); iter != entry.end() && iter->is_string()) {
        return fmt::format("test #{} ({:?})", index + 1, iter->get<std::string>());
    }
    return fmt::format("test #{}", index + 1);
}

} // namespace

SuiteLoader::SuiteLoader(fs::path tests_dir, SearchPath search_path)
    : tests_dir_{std::move(tests_dir)}
    , search_path_{std::move(search_path)} {}

std::vector<fs::path> SuiteLoader::discover_manifests() const {
    std::vector<fs::path> manifests;
    std::error_code err;

    for (const auto& entry : fs::directory_iterator{tests_dir_, err}) {
        const std::string file_name = entry.path().filename().string();

        if (!entry.is_regular_file(err) || !file_name.starts_with("test") || entry.path().extension() != ".json") {
            continue;
        }

        manifests.push_back(entry.path());
    }

    if (err) {
        LOG_WARN("Error while listing {:?}: {}", tests_dir_.string(), err);
    }

    ranges::sort(manifests, [](const fs::path& lhs, const fs::path& rhs) { return lhs.filename() < rhs.filename(); });

    return manifests;
}

TestSuite SuiteLoader::load() const {
    std::error_code err;
    if (!fs::is_directory(tests_dir_, err)) {
        throw SuiteError(fmt::format("tests location {:?} is not a directory", tests_dir_.string()));
    }

    TestSuite suite;

    if (fs::path config_path = tests_dir_ / CONFIG_FILE_NAME; fs::exists(config_path, err)) {
        json config;

        auto with_context = [&config_path](const std::string& msg) {
            return SuiteError(fmt::format("{}: {}", config_path.filename().string(), msg));
        };

        if (auto res = read_json_file(config_path, config); !res) {
            throw SuiteError(res.error());
        }

        if (auto res = check_object(config, "the configuration"); !res) {
            throw with_context(res.error());
        }

        auto known_keys = reject_unknown_keys(config, {"language", "build", "memory_check", "scoring"},
                                              "the configuration");
        if (!known_keys) {
            throw with_context(known_keys.error());
        }

        auto profile = parse_language_profile(config);
        if (!profile) {
            throw with_context(profile.error());
        }

        auto scoring = parse_scoring_policy(config);
        if (!scoring) {
            throw with_context(scoring.error());
        }

        suite.profile = profile.value();
        suite.scoring = scoring.value();
    } else {
        LOG_DEBUG("No {} in {:?}; using defaults", CONFIG_FILE_NAME, tests_dir_.string());
    }

    std::vector<fs::path> manifests = discover_manifests();
    std::set<std::string> seen_names;

    for (const fs::path& manifest : manifests) {
        auto cases = load_manifest(manifest);
        if (!cases) {
            throw SuiteError(cases.error());
        }

        for (TestCase& test : cases.value()) {
            if (!seen_names.insert(test.name).second) {
                throw SuiteError(
                    fmt::format("{}: duplicate test name {:?}", manifest.filename().string(), test.name));
            }
            suite.tests.push_back(std::move(test));
        }
    }

    if (suite.tests.empty()) {
        LOG_WARN("No tests found in {:?}", tests_dir_.string());
    }

    LOG_INFO("Loaded {} tests from {} manifest(s); language = {}", suite.tests.size(), manifests.size(),
             suite.profile.kind);

    return suite;
}

ParseResult<std::vector<TestCase>> SuiteLoader::load_manifest(const fs::path& manifest) const {
    const std::string file_name = manifest.filename().string();
    json document;

    TRY(read_json_file(manifest, document));

    if (auto res = check_object(document, "a test manifest"); !res) {
        return fmt::format("{}: {}", file_name, res.error());
    }

    if (auto res = reject_unknown_keys(document, {"defaults", "tests"}, "a test manifest"); !res) {
        return fmt::format("{}: {}", file_name, res.error());
    }

    json defaults = json::object();
    if (auto iter = document.find("defaults"); iter != document.end()) {
        if (!iter->is_object()) {
            return fmt::format("{}: \"defaults\" must be a JSON object", file_name);
        }
        defaults = *iter;
    }

    auto tests_iter = document.find("tests");
    if (tests_iter == document.end() || !tests_iter->is_array()) {
        return fmt::format("{}: \"tests\" must be an array", file_name);
    }

    std::vector<TestCase> cases;
    cases.reserve(tests_iter->size());

    for (std::size_t i = 0; i < tests_iter->size(); ++i) {
        const json& entry = (*tests_iter)[i];

        if (!entry.is_object()) {
            return fmt::format("{}: test #{} must be a JSON object", file_name, i + 1);
        }

        json merged = defaults;
        merged.merge_patch(entry);

        auto test = parse_case(merged, manifest);
        if (!test) {
            return fmt::format("{}: {}: {}", file_name, describe_case(i, entry), test.error());
        }

        cases.push_back(std::move(test.value()));
    }

    LOG_DEBUG("{}: {} test(s)", file_name, cases.size());

    return cases;
}

ParseResult<TestCase> SuiteLoader::parse_case(const json& entry, const fs::path& manifest) const {
    TRY(reject_unknown_keys(entry,
                            {"name", "description", "command", "stdin", "stdin_file", "cwd", "env", "timeout",
                             "max_points", "points_lost_on_failure", "hidden", "include_in_results", "memory_check",
                             "skip", "expect"},
                            "a test"));

    TestCase test;
    test.origin = manifest;

    TRY(read_field(entry, "name", test.name));
    if (test.name.empty()) {
        return std::string{"\"name\" is required"};
    }

    TRY(read_field(entry, "description", test.description));
    TRY(read_command(entry, "command", test.command));
    TRY(read_field(entry, "env", test.env));
    TRY(read_timeout(entry, "timeout", test.timeout));
    TRY(read_non_negative(entry, "max_points", test.max_points));
    TRY(read_non_negative(entry, "points_lost_on_failure", test.points_lost_on_failure));
    TRY(read_field(entry, "hidden", test.hidden));
    TRY(read_field(entry, "include_in_results", test.include_in_results));
    TRY(read_field(entry, "memory_check", test.memory_check));

    std::optional<std::string> cwd;
    TRY(read_field(entry, "cwd", cwd));
    if (cwd) {
        test.cwd = fs::path{*cwd};
    }

    // "skip": true, or "skip": "<reason>"
    if (auto iter = entry.find("skip"); iter != entry.end()) {
        if (iter->is_boolean()) {
            if (iter->get<bool>()) {
                test.skip_reason = "skipped by the instructor";
            }
        } else if (iter->is_string()) {
            test.skip_reason = iter->get<std::string>();
        } else {
            return std::string{R"("skip" must be a boolean or a reason string)"};
        }
    }

    if (test.command.empty() && !test.skip_reason) {
        return std::string{"\"command\" is required"};
    }

    std::optional<std::string> stdin_file;
    TRY(read_field(entry, "stdin", test.stdin_data));
    TRY(read_field(entry, "stdin_file", stdin_file));

    if (test.stdin_data && stdin_file) {
        return std::string{R"("stdin" and "stdin_file" are mutually exclusive)"};
    }

    std::optional<std::string> stdout_file;
    std::optional<std::string> stderr_file;
    if (auto iter = entry.find("expect"); iter != entry.end()) {
        TRY(parse_expectation(*iter, test.expected, stdout_file, stderr_file));
    }

    // Skipped tests never run, so their fixtures need not exist
    if (test.skip_reason) {
        return test;
    }

    if (stdin_file) {
        test.stdin_data.emplace();
        TRY(read_fixture(*stdin_file, manifest, *test.stdin_data));
    }

    if (stdout_file) {
        test.expected.stdout_text.emplace();
        TRY(read_fixture(*stdout_file, manifest, *test.expected.stdout_text));
    }

    if (stderr_file) {
        test.expected.stderr_text.emplace();
        TRY(read_fixture(*stderr_file, manifest, *test.expected.stderr_text));
    }

    return test;
}

ParseResult<void> SuiteLoader::read_fixture(const std::string& name, const fs::path& manifest,
                                            std::string& contents) const {
    std::optional<fs::path> resolved = search_path_.resolve(name, manifest.parent_path());

    if (!resolved) {
        return fmt::format("fixture file {:?} not found next to the manifest or on the test search path ({})", name,
                           search_path_.to_string());
    }

    std::ifstream file{*resolved, std::ios::binary};
    if (!file) {
        return fmt::format("could not open fixture file {:?}", resolved->string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    if (file.bad()) {
        return fmt::format("error while reading fixture file {:?}", resolved->string());
    }

    contents = std::move(buffer).str();
    LOG_TRACE("Read fixture {:?} ({} bytes)", resolved->string(), contents.size());

    return {};
}

ParseResult<LanguageProfile> parse_language_profile(const json& config) {
    LanguageProfile profile;

    if (auto iter = config.find("language"); iter != config.end()) {
        std::string language = iter->is_string() ? iter->get<std::string>() : std::string{};

        if (language == "interpreted") {
            profile.kind = LanguageKind::Interpreted;
        } else if (language == "compiled") {
            profile.kind = LanguageKind::Compiled;
        } else {
            return std::string{R"("language" must be "interpreted" or "compiled")"};
        }
    }

    if (auto iter = config.find("build"); iter != config.end()) {
        TRY(parse_build_section(*iter, profile));
    }

    if (auto iter = config.find("memory_check"); iter != config.end()) {
        TRY(parse_memory_check(*iter, profile.memory_check));
    }

    return profile;
}

ParseResult<ScoringPolicy> parse_scoring_policy(const json& config) {
    ScoringPolicy policy;

    auto iter = config.find("scoring");
    if (iter == config.end()) {
        return policy;
    }

    const json& scoring = *iter;

    TRY(check_object(scoring, "\"scoring\""));
    TRY(reject_unknown_keys(scoring, {"credit", "apply_penalties", "score_floor", "score_ceiling"}, "\"scoring\""));

    if (auto credit = scoring.find("credit"); credit != scoring.end()) {
        TRY(check_object(*credit, "\"scoring.credit\""));
        TRY(reject_unknown_keys(*credit, {"failed", "errored", "timed-out"}, "\"scoring.credit\""));

        TRY(read_fraction(*credit, "failed", policy.failed_credit));
        TRY(read_fraction(*credit, "errored", policy.errored_credit));
        TRY(read_fraction(*credit, "timed-out", policy.timed_out_credit));
    }

    TRY(read_field(scoring, "apply_penalties", policy.apply_penalties));
    TRY(read_fraction(scoring, "score_floor", policy.score_floor));
    TRY(read_fraction(scoring, "score_ceiling", policy.score_ceiling));

    if (policy.score_floor > policy.score_ceiling) {
        return fmt::format("\"score_floor\" ({}) must not exceed \"score_ceiling\" ({})", policy.score_floor,
                           policy.score_ceiling);
    }

    return policy;
}

ParseResult<void> read_json_file(const fs::path& path, json& document) {
    std::ifstream file{path};
    if (!file) {
        return fmt::format("could not open {:?}", path.string());
    }

    try {
        document = json::parse(file);
    } catch (const json::parse_error& ex) {
        return fmt::format("{}: invalid JSON: {}", path.filename().string(), ex.what());
    }

    return {};
}

} // namespace gradebox
