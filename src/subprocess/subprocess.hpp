#pragma once

#include <gradebox/common/class_traits.hpp>
#include <gradebox/common/error_types.hpp>
#include <gradebox/common/expected.hpp>

#include "subprocess/run_result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/resource.h>
#include <sys/types.h>

namespace gradebox {

/// Credentials a child switches to before exec
struct ProcessIdentity
{
    uid_t uid;
    gid_t gid;
};

struct ResourceLimits
{
    bool disable_core_dumps = true;

    /// RLIMIT_FSIZE in bytes; unlimited if unset
    std::optional<rlim_t> max_file_size;
};

/// Everything needed to launch one child process
struct SpawnRequest
{
    /// argv[0] is looked up in PATH when it contains no '/'
    std::vector<std::string> argv;

    /// Inherited from the harness if empty
    std::filesystem::path cwd;

    /// Applied on top of the harness environment
    std::map<std::string, std::string> env;

    std::optional<std::string> stdin_data;

    std::chrono::milliseconds timeout = std::chrono::seconds{10};

    /// Per-stream capture cap
    std::size_t max_output = DEFAULT_MAX_OUTPUT;

    /// Stay as the harness identity if unset
    std::optional<ProcessIdentity> identity;

    ResourceLimits limits;

    static constexpr std::size_t DEFAULT_MAX_OUTPUT = 64 * 1024;
};

/// Why a child could not be run to completion
struct ProcessError
{
    // NOLINTNEXTLINE(google-explicit-constructor)
    ProcessError(ErrorKind error_kind, std::string msg = "")
        : kind{error_kind}
        , detail{std::move(msg)} {}

    ErrorKind kind;
    std::string detail;

    bool operator==(const ProcessError&) const = default;
};

template <typename T>
using ProcessResult = Expected<T, ProcessError>;

/// A child process in its own process group, with captured stdout / stderr.
///
/// Lifecycle: construct, ``start``, then ``communicate`` once. Destroying a started process that
/// has not been collected kills its whole group.
///
/// The harness becomes a child subreaper on the first ``start``. Once a child is collected, every
/// descendant it left behind is killed, including ones that escaped its group with setsid(2).
class Subprocess : NonMovable
{
public:
    explicit Subprocess(SpawnRequest request);
    ~Subprocess();

    /// Fork and exec. Failures of any step in the child (identity switch, limits, chdir, exec) are
    /// reported here, not as an exit code.
    ProcessResult<void> start();

    /// Feed stdin, capture output, and wait for the child to end or its deadline to pass.
    /// On expiry the whole process group is SIGKILLed.
    ProcessResult<CapturedRun> communicate();

    pid_t get_pid() const { return child_pid_; }

    bool is_started() const { return child_pid_ != 0; }

private:
    struct Pipes
    {
        int stdin_write = -1;
        int stdout_read = -1;
        int stderr_read = -1;
    };

    /// Resolves argv[0] against PATH from the child's environment
    ProcessResult<std::string> resolve_executable(const std::vector<std::string>& envp) const;

    std::vector<std::string> build_environment() const;

    Result<void> kill_group();

    /// Stops tracking the collected child, then kills and reaps anything it left running
    void mark_reaped();

    void close_pipes();

    SpawnRequest request_;

    pid_t child_pid_ = 0;
    bool reaped_ = false;

    std::chrono::steady_clock::time_point start_time_;

    Pipes pipes_;
};

/// ``start`` + ``communicate``
ProcessResult<CapturedRun> run_subprocess(SpawnRequest request);

} // namespace gradebox

template <>
struct fmt::formatter<::gradebox::ProcessError> : fmt::formatter<std::string>
{
    auto format(const ::gradebox::ProcessError& from, fmt::format_context& ctx) const {
        if (from.detail.empty()) {
            return fmt::format_to(ctx.out(), "{}", from.kind);
        }
        return fmt::format_to(ctx.out(), "{}: {}", from.kind, from.detail);
    }
};
