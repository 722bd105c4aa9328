#pragma once

#include <gradebox/model/language_profile.hpp>

#include "subprocess/run_result.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace gradebox {

/// Runs test invocations under a memory checker (valgrind's memcheck by default) and decides whether
/// the checker reported a violation.
///
/// The checker writes its report to a log file in the scratch directory rather than to stderr, so the
/// program's own stderr is still compared as usual.
class MemoryChecker
{
public:
    /// ``log_owner`` is the uid the checker runs as; the harness's own if unset
    MemoryChecker(MemoryCheckConfig config, std::filesystem::path scratch_dir,
                  std::optional<uid_t> log_owner = std::nullopt);

    struct Invocation
    {
        std::vector<std::string> argv;
        std::filesystem::path log_file;
    };

    /// ``tool [tool_args...] --log-file=<log> --error-exitcode=<n> argv...``
    /// Throws std::filesystem::filesystem_error if the scratch directory cannot be created
    Invocation wrap(const std::vector<std::string>& argv, std::string_view test_name);

    /// Diagnostic text if the checker saw a memory-safety violation, nullopt otherwise.
    /// Consumes (deletes) the log file. A log that is not a regular file owned by ``log_owner`` is
    /// treated as missing.
    std::optional<std::string> collect_violation(const CapturedRun& run, const std::filesystem::path& log_file,
                                                 std::size_t max_report_size) const;

    /// Number of errors in a memcheck "ERROR SUMMARY: N errors from M contexts" line, if there is one
    static std::optional<long> parse_error_summary(std::string_view log);

    const MemoryCheckConfig& get_config() const { return config_; }

private:
    MemoryCheckConfig config_;
    std::filesystem::path scratch_dir_;
    uid_t log_owner_;

    std::atomic<std::size_t> next_log_id_ = 0;
};

} // namespace gradebox
