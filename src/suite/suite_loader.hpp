#pragma once

#include <gradebox/common/expected.hpp>
#include <gradebox/model/language_profile.hpp>
#include <gradebox/model/scoring_policy.hpp>
#include <gradebox/model/test_case.hpp>

#include "suite/search_path.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

/// Parse failures carry a human-readable diagnostic. T must not be a string type
template <typename T>
using ParseResult = Expected<T, std::string>;

/// Reads the instructor suite out of the tests location.
///
/// Layout:
///   gradebox.json  - language profile and scoring policy (optional)
///   test*.json     - ordered ``tests`` arrays, loaded in file name order
///
/// Fixture files (stdin_file, stdout_file, stderr_file) are resolved first next to the manifest
/// that names them, then through the search path, and read at load time.
class SuiteLoader
{
public:
    SuiteLoader(std::filesystem::path tests_dir, SearchPath search_path);

    /// Throws SuiteError if the suite or its configuration is invalid
    TestSuite load() const;

    /// ``test*.json`` files directly inside the tests directory, sorted by file name
    std::vector<std::filesystem::path> discover_manifests() const;

    static constexpr std::string_view CONFIG_FILE_NAME = "gradebox.json";

private:
    ParseResult<std::vector<TestCase>> load_manifest(const std::filesystem::path& manifest) const;

    ParseResult<TestCase> parse_case(const nlohmann::json& entry, const std::filesystem::path& manifest) const;

    /// Resolves ``name`` and reads the file into ``contents``
    ParseResult<void> read_fixture(const std::string& name, const std::filesystem::path& manifest,
                                   std::string& contents) const;

    std::filesystem::path tests_dir_;
    SearchPath search_path_;
};

ParseResult<LanguageProfile> parse_language_profile(const nlohmann::json& config);

ParseResult<ScoringPolicy> parse_scoring_policy(const nlohmann::json& config);

/// Reads and parses a JSON document into ``document``; parse errors are returned with the file name
ParseResult<void> read_json_file(const std::filesystem::path& path, nlohmann::json& document);

} // namespace gradebox
