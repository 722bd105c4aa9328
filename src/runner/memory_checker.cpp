#include "runner/memory_checker.hpp"

#include <gradebox/common/linux.hpp>
#include <gradebox/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>

#include <cctype>
#include <charconv>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace gradebox {

namespace fs = std::filesystem;

namespace {

/// Test names may contain anything; log file names may not
std::string sanitize_file_name(std::string_view name) {
    std::string result;

    for (char chr : name) {
        if (std::isalnum(static_cast<unsigned char>(chr)) != 0 || chr == '-' || chr == '_') {
            result += chr;
        } else {
            result += '_';
        }
    }

    return result.substr(0, 64);
}

constexpr std::size_t LOG_READ_CHUNK_SZ = 4096;

/// The scratch directory is writable by submission code, so the log may have been swapped for something
/// else by the time the harness reads it. Only a regular, singly linked file owned by ``expected_owner``
/// is accepted, and a symlink in its place is never followed.
///
/// More than the last ``keep_tail`` bytes are kept; the error summary is at the end.
std::optional<std::string> read_log(const fs::path& log_file, uid_t expected_owner, std::size_t keep_tail) {
    auto fd = linux::open(log_file.string(), O_RDONLY | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC);

    if (!fd) {
        if (fd.error() == std::errc::too_many_symbolic_link_levels) {
            LOG_WARN("Memory checker log {:?} was replaced by a symlink; ignoring it", log_file.string());
        }
        return std::nullopt;
    }

    auto close_log = gsl::finally([log_fd = fd.value()] { std::ignore = linux::close(log_fd); });

    auto info = linux::fstat(fd.value());
    if (!info) {
        return std::nullopt;
    }

    if (!S_ISREG(info->st_mode) || info->st_nlink != 1 || info->st_uid != expected_owner) {
        LOG_WARN("Memory checker log {:?} is not a regular file owned by uid {} (mode {:o}, links {}, uid {}); "
                 "ignoring it",
                 log_file.string(), expected_owner, info->st_mode, info->st_nlink, info->st_uid);
        return std::nullopt;
    }

    std::string contents;

    while (true) {
        auto chunk = linux::read(fd.value(), LOG_READ_CHUNK_SZ);

        if (!chunk) {
            LOG_WARN("Could not read memory checker log {:?}: {}", log_file.string(), chunk.error().message());
            return std::nullopt;
        }

        if (chunk->empty()) {
            break;
        }

        contents += *chunk;

        if (contents.size() / 4 > keep_tail + LOG_READ_CHUNK_SZ) {
            contents.erase(0, contents.size() - 2 * keep_tail);
        }
    }

    return contents;
}

} // namespace

MemoryChecker::MemoryChecker(MemoryCheckConfig config, fs::path scratch_dir, std::optional<uid_t> log_owner)
    : config_{std::move(config)}
    , scratch_dir_{std::move(scratch_dir)}
    , log_owner_{log_owner.value_or(linux::geteuid())} {}

MemoryChecker::Invocation MemoryChecker::wrap(const std::vector<std::string>& argv, std::string_view test_name) {
    // Normally already prepared by the privilege separator or the pipeline
    fs::create_directories(scratch_dir_);

    std::size_t log_id = next_log_id_++;
    fs::path log_file = scratch_dir_ / fmt::format("memcheck-{}-{}.log", log_id, sanitize_file_name(test_name));

    std::vector<std::string> wrapped;
    wrapped.reserve(config_.tool_args.size() + argv.size() + 3);

    wrapped.push_back(config_.tool);
    wrapped.insert(wrapped.end(), config_.tool_args.begin(), config_.tool_args.end());
    wrapped.push_back(fmt::format("--log-file={}", log_file.string()));
    wrapped.push_back(fmt::format("--error-exitcode={}", config_.error_exit_code));
    wrapped.insert(wrapped.end(), argv.begin(), argv.end());

    return {.argv = std::move(wrapped), .log_file = std::move(log_file)};
}

std::optional<std::string> MemoryChecker::collect_violation(const CapturedRun& run, const fs::path& log_file,
                                                            std::size_t max_report_size) const {
    std::optional<std::string> log = read_log(log_file, log_owner_, max_report_size);

    std::error_code err;
    fs::remove(log_file, err);

    if (!log) {
        LOG_WARN("Memory checker log {:?} is missing or unusable", log_file.string());
    }

    const bool sentinel_exit = run.result.exited_with(config_.error_exit_code);
    const std::optional<long> num_errors = log ? parse_error_summary(*log) : std::nullopt;

    if (!sentinel_exit && num_errors.value_or(0) == 0) {
        return std::nullopt;
    }

    std::string report = log.value_or("");
    if (report.size() > max_report_size) {
        report = "...\n" + report.substr(report.size() - max_report_size);
    }

    LOG_DEBUG("Memory check violation (sentinel exit: {}, errors: {})", sentinel_exit, num_errors.value_or(-1));

    return fmt::format("Memory errors detected ({} reported by {}):\n{}", num_errors.value_or(1), config_.tool,
                       report);
}

std::optional<long> MemoryChecker::parse_error_summary(std::string_view log) {
    static constexpr std::string_view marker = "ERROR SUMMARY: ";

    std::size_t pos = log.rfind(marker);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }

    // Large counts are printed with thousands separators
    std::string digits;
    for (char chr : log.substr(pos + marker.size())) {
        if (std::isdigit(static_cast<unsigned char>(chr)) != 0) {
            digits += chr;
        } else if (chr != ',') {
            break;
        }
    }

    long count = 0;
    if (digits.empty() || std::from_chars(digits.data(), digits.data() + digits.size(), count).ec != std::errc{}) {
        return std::nullopt;
    }

    return count;
}

} // namespace gradebox
