#include "subprocess/subprocess.hpp"

#include <gradebox/common/error_types.hpp>
#include <gradebox/common/expected.hpp>
#include <gradebox/common/linux.hpp>
#include <gradebox/logging.hpp>

#include "subprocess/bounded_buffer.hpp"
#include "subprocess/run_result.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gsl/util>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ; // NOLINT(readability-redundant-declaration)

namespace gradebox {

namespace {

/// Steps of child setup, reported back to the parent on failure
enum class ChildStep : int { SetPgid, Dup2, Signals, Limits, SetGroups, SetGid, SetUid, Chdir, Exec };

constexpr std::string_view to_string(ChildStep step) {
    switch (step) {
    case ChildStep::SetPgid:
        return "setpgid";
    case ChildStep::Dup2:
        return "dup2";
    case ChildStep::Signals:
        return "signal reset";
    case ChildStep::Limits:
        return "setrlimit";
    case ChildStep::SetGroups:
        return "setgroups";
    case ChildStep::SetGid:
        return "setgid";
    case ChildStep::SetUid:
        return "setuid";
    case ChildStep::Chdir:
        return "chdir";
    case ChildStep::Exec:
        return "execve";
    }
    return "<unknown step>";
}

/// Written by the child to the status pipe if it fails before exec
struct ChildFailure
{
    ChildStep step;
    int err;
};

constexpr int CHILD_SETUP_FAILURE_CODE = 127;

constexpr std::size_t READ_CHUNK_SZ = 4096;

/// Upper bound on one poll(2) wait, so that the child's exit is noticed promptly
constexpr std::chrono::milliseconds POLL_INTERVAL{20};

/// How long to keep draining pipes after the process group was killed
constexpr std::chrono::milliseconds DRAIN_GRACE{200};

/// Bound on kill-and-reap rounds when clearing out orphaned descendants; each round takes one generation
constexpr int MAX_SWEEP_PASSES = 64;

/// Everything the child needs, prepared before fork so that the child only makes raw syscalls
struct ChildPlan
{
    std::string exec_path;
    std::vector<char*> argv;
    std::vector<char*> envp;
    const char* cwd; // nullptr to inherit
    const ProcessIdentity* identity;
    const ResourceLimits* limits;
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
    int status_fd;
};

[[noreturn]] void report_child_failure(int status_fd, ChildStep step) {
    ChildFailure failure{.step = step, .err = errno};

    // Nothing sensible can be done if this write fails; the parent then sees an exit code of 127
    [[maybe_unused]] auto res = ::write(status_fd, &failure, sizeof(failure));

    ::_exit(CHILD_SETUP_FAILURE_CODE);
}

/// Runs in the forked child. Only async-signal-safe calls are allowed here, since the harness may
/// have other threads spawning tests concurrently
[[noreturn]] void exec_child(const ChildPlan& plan) {
    if (::setpgid(0, 0) == -1) {
        report_child_failure(plan.status_fd, ChildStep::SetPgid);
    }

    if (::dup2(plan.stdin_fd, STDIN_FILENO) == -1 || ::dup2(plan.stdout_fd, STDOUT_FILENO) == -1 ||
        ::dup2(plan.stderr_fd, STDERR_FILENO) == -1) {
        report_child_failure(plan.status_fd, ChildStep::Dup2);
    }

    // The harness ignores SIGPIPE, and ignored dispositions survive exec
    struct sigaction default_action{};
    default_action.sa_handler = SIG_DFL;
    ::sigemptyset(&default_action.sa_mask);

    sigset_t empty_set;
    ::sigemptyset(&empty_set);

    if (::sigaction(SIGPIPE, &default_action, nullptr) == -1 ||
        ::sigprocmask(SIG_SETMASK, &empty_set, nullptr) == -1) {
        report_child_failure(plan.status_fd, ChildStep::Signals);
    }

    if (plan.limits->disable_core_dumps) {
        struct rlimit no_core{.rlim_cur = 0, .rlim_max = 0};
        if (::setrlimit(RLIMIT_CORE, &no_core) == -1) {
            report_child_failure(plan.status_fd, ChildStep::Limits);
        }
    }

    if (plan.limits->max_file_size) {
        struct rlimit fsize{.rlim_cur = *plan.limits->max_file_size, .rlim_max = *plan.limits->max_file_size};
        if (::setrlimit(RLIMIT_FSIZE, &fsize) == -1) {
            report_child_failure(plan.status_fd, ChildStep::Limits);
        }
    }

    // Order matters: groups and gid can only be changed while still privileged
    if (plan.identity != nullptr) {
        if (::setgroups(0, nullptr) == -1) {
            report_child_failure(plan.status_fd, ChildStep::SetGroups);
        }
        if (::setgid(plan.identity->gid) == -1) {
            report_child_failure(plan.status_fd, ChildStep::SetGid);
        }
        if (::setuid(plan.identity->uid) == -1) {
            report_child_failure(plan.status_fd, ChildStep::SetUid);
        }
    }

    if (plan.cwd != nullptr && ::chdir(plan.cwd) == -1) {
        report_child_failure(plan.status_fd, ChildStep::Chdir);
    }

    ::execve(plan.exec_path.c_str(), plan.argv.data(), plan.envp.data());

    report_child_failure(plan.status_fd, ChildStep::Exec);
}

void prepare_harness_once() {
    static std::once_flag flag;

    std::call_once(flag, [] {
        if (auto res = linux::signal(SIGPIPE, SIG_IGN); !res) {
            LOG_WARN("Could not ignore SIGPIPE: {}", res.error().message());
        }

        // Anything a child leaves behind (daemons included) is reparented to us instead of init
        if (auto res = linux::set_child_subreaper(); !res) {
            LOG_WARN("Could not become a child subreaper; detached processes may outlive their test: {}",
                     res.error().message());
        }
    });
}

/// Children owned by a live ``Subprocess``. Each pid is also its child's process group id.
struct TrackedChildren
{
    std::mutex mutex;
    std::multiset<pid_t> pids;
};

TrackedChildren& tracked_children() {
    static TrackedChildren instance;
    return instance;
}

void untrack_child(pid_t pid) {
    TrackedChildren& tracked = tracked_children();
    std::lock_guard lock{tracked.mutex};

    if (auto iter = tracked.pids.find(pid); iter != tracked.pids.end()) {
        tracked.pids.erase(iter);
    }
}

struct ProcStat
{
    char state;
    pid_t ppid;
    pid_t pgrp;
};

/// See proc(5). The command name may contain anything, so fields are read after its closing paren
std::optional<ProcStat> read_proc_stat(const std::filesystem::path& proc_dir) {
    std::ifstream file{proc_dir / "stat"};
    std::string line;

    if (!std::getline(file, line)) {
        return std::nullopt;
    }

    auto close_paren = line.rfind(')');
    if (close_paren == std::string::npos) {
        return std::nullopt;
    }

    std::istringstream fields{line.substr(close_paren + 1)};
    ProcStat stat{};

    if (!(fields >> stat.state >> stat.ppid >> stat.pgrp)) {
        return std::nullopt;
    }

    return stat;
}

std::optional<pid_t> parse_pid(const std::string& name) {
    pid_t pid = 0;
    const char* end = name.data() + name.size();
    auto [ptr, ec] = std::from_chars(name.data(), end, pid);

    if (ec != std::errc{} || ptr != end || name.empty()) {
        return std::nullopt;
    }
    return pid;
}

/// SIGKILLs every child of the harness that no live ``Subprocess`` accounts for, directly or through
/// its process group. Called with the tracked set locked, so that no new child can appear unregistered.
std::vector<pid_t> kill_untracked_children(const TrackedChildren& tracked) {
    namespace fs = std::filesystem;

    const pid_t self = ::getpid();
    std::vector<pid_t> killed;

    std::error_code err;
    for (auto iter = fs::directory_iterator{"/proc", err}; !err && iter != fs::directory_iterator{};
         iter.increment(err)) {
        auto pid = parse_pid(iter->path().filename().string());
        if (!pid) {
            continue;
        }

        auto stat = read_proc_stat(iter->path());
        if (!stat || stat->ppid != self) {
            continue;
        }

        // Background jobs of a test that is still running stay in that test's group
        if (tracked.pids.contains(*pid) || tracked.pids.contains(stat->pgrp)) {
            continue;
        }

        if (stat->state != 'Z') {
            LOG_DEBUG("Killing stray process {} left behind by a finished child", *pid);
        }

        if (auto res = linux::kill(*pid, SIGKILL); !res && res.error() != std::errc::no_such_process) {
            LOG_WARN("Could not kill stray process {}: {}", *pid, res.error().message());
            continue;
        }

        killed.push_back(*pid);
    }

    if (err) {
        LOG_WARN("Could not scan /proc for stray processes: {}", err.message());
    }

    return killed;
}

/// Orphans of finished children are reparented to the harness (see ``prepare_harness_once``), so
/// killing and reaping them one generation at a time eventually clears out whole detached trees.
void collect_stray_descendants() {
    // Strays are only ever reaped here, so a pid found in a scan cannot be recycled before it is killed
    static std::mutex sweep_mutex;
    std::lock_guard sweep_lock{sweep_mutex};

    for (int pass = 0; pass < MAX_SWEEP_PASSES; ++pass) {
        std::vector<pid_t> killed;

        {
            TrackedChildren& tracked = tracked_children();
            std::lock_guard lock{tracked.mutex};

            killed = kill_untracked_children(tracked);
        }

        if (killed.empty()) {
            return;
        }

        for (pid_t pid : killed) {
            if (auto res = linux::waitpid(pid); !res && res.error() != std::errc::no_child_process) {
                LOG_WARN("Could not reap stray process {}: {}", pid, res.error().message());
            }
        }
    }

    LOG_WARN("Stray processes were still appearing after {} rounds of cleanup", MAX_SWEEP_PASSES);
}

Result<void> set_nonblocking(int fd) {
    int flags = TRYE(linux::fcntl(fd, F_GETFL), SyscallFailure);

    TRYE(linux::fcntl(fd, F_SETFL, flags | O_NONBLOCK), SyscallFailure); // NOLINT

    return {};
}

void close_fd(int& fd) {
    if (fd == -1) {
        return;
    }

    if (auto res = linux::close(fd); !res) {
        LOG_WARN("Failed to close fd {}: {}", fd, res.error().message());
    }

    fd = -1;
}

bool is_would_block(const std::error_code& err) {
    return err == std::errc::resource_unavailable_try_again || err == std::errc::operation_would_block ||
           err == std::errc::interrupted;
}

/// Reads whatever is available on ``fd`` into ``buffer``. Closes ``fd`` on EOF or error
void drain_available(int& fd, BoundedBuffer& buffer) {
    while (fd != -1) {
        auto res = linux::read(fd, READ_CHUNK_SZ);

        if (!res) {
            if (!is_would_block(res.error())) {
                LOG_DEBUG("Closing output pipe after read error: {}", res.error().message());
                close_fd(fd);
            }
            return;
        }

        if (res->empty()) {
            close_fd(fd);
            return;
        }

        buffer.append(*res);
    }
}

} // namespace

Subprocess::Subprocess(SpawnRequest request)
    : request_{std::move(request)} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then the process was never started
    if (child_pid_ != 0 && !reaped_) {
        std::ignore = kill_group();

        if (auto res = linux::waitpid(child_pid_); !res) {
            LOG_WARN("Could not reap child {}: {}", child_pid_, res.error().message());
        }
        mark_reaped();
    }

    close_pipes();
}

std::vector<std::string> Subprocess::build_environment() const {
    std::map<std::string, std::string> merged;

    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view kv{*entry};
        auto eq_pos = kv.find('=');

        if (eq_pos == std::string_view::npos) {
            continue;
        }

        merged.emplace(std::string{kv.substr(0, eq_pos)}, std::string{kv.substr(eq_pos + 1)});
    }

    for (const auto& [key, value] : request_.env) {
        merged.insert_or_assign(key, value);
    }

    std::vector<std::string> result;
    result.reserve(merged.size());

    for (const auto& [key, value] : merged) {
        result.push_back(fmt::format("{}={}", key, value));
    }

    return result;
}

ProcessResult<std::string> Subprocess::resolve_executable(const std::vector<std::string>& envp) const {
    const std::string& name = request_.argv.front();

    // Paths with a slash are taken as-is; relative ones resolve against the child's cwd after chdir
    if (name.find('/') != std::string::npos) {
        return name;
    }

    auto path_entry =
        ranges::find_if(envp, [](const std::string& entry) { return std::string_view{entry}.starts_with("PATH="); });

    std::string_view search_path = "/usr/local/bin:/usr/bin:/bin";

    if (path_entry != envp.end()) {
        search_path = std::string_view{*path_entry}.substr(std::string_view{"PATH="}.size());
    }

    while (!search_path.empty()) {
        auto colon_pos = search_path.find(':');
        std::string_view dir = search_path.substr(0, colon_pos);

        search_path = colon_pos == std::string_view::npos ? std::string_view{} : search_path.substr(colon_pos + 1);

        if (dir.empty()) {
            dir = ".";
        }

        std::string candidate = fmt::format("{}/{}", dir, name);

        if (linux::access(candidate, X_OK)) {
            return candidate;
        }
    }

    return ProcessError{ErrorKind::NotFound, fmt::format("command not found: {:?}", name)};
}

ProcessResult<void> Subprocess::start() {
    ASSERT(child_pid_ == 0, "Subprocess may only be started once");

    if (request_.argv.empty()) {
        return ProcessError{ErrorKind::SpawnFailure, "empty command"};
    }

    prepare_harness_once();

    std::vector<std::string> env_strings = build_environment();
    std::string exec_path = TRY(resolve_executable(env_strings));

    std::vector<std::string> argv_strings = request_.argv;

    ChildPlan plan{.exec_path = std::move(exec_path),
                   .argv = {},
                   .envp = {},
                   .cwd = request_.cwd.empty() ? nullptr : request_.cwd.c_str(),
                   .identity = request_.identity ? &request_.identity.value() : nullptr,
                   .limits = &request_.limits,
                   .stdin_fd = -1,
                   .stdout_fd = -1,
                   .stderr_fd = -1,
                   .status_fd = -1};

    for (auto& arg : argv_strings) {
        plan.argv.push_back(arg.data());
    }
    plan.argv.push_back(nullptr);

    for (auto& entry : env_strings) {
        plan.envp.push_back(entry.data());
    }
    plan.envp.push_back(nullptr);

    // All pipes are close-on-exec so that concurrently spawned children never inherit each other's ends;
    // dup2 clears the flag on the three standard descriptors
    linux::Pipe stdin_pipe;
    linux::Pipe stdout_pipe;
    linux::Pipe stderr_pipe;
    linux::Pipe status_pipe;

    // The parent's ends are owned by pipes_ and closed with the object
    auto close_child_ends = gsl::finally([&] {
        for (int* fd : {&stdin_pipe.read_fd, &stdout_pipe.write_fd, &stderr_pipe.write_fd, &status_pipe.read_fd,
                        &status_pipe.write_fd}) {
            close_fd(*fd);
        }
    });

    stdin_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    pipes_.stdin_write = stdin_pipe.write_fd;

    stdout_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    pipes_.stdout_read = stdout_pipe.read_fd;

    stderr_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    pipes_.stderr_read = stderr_pipe.read_fd;

    status_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    plan.stdin_fd = stdin_pipe.read_fd;
    plan.stdout_fd = stdout_pipe.write_fd;
    plan.stderr_fd = stderr_pipe.write_fd;
    plan.status_fd = status_pipe.write_fd;

    start_time_ = std::chrono::steady_clock::now();

    {
        // Registered before any stray sweep can see the new child
        TrackedChildren& tracked = tracked_children();
        std::lock_guard lock{tracked.mutex};

        linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

        if (fork_res.which == linux::Fork::Child) {
            exec_child(plan);
        }

        child_pid_ = fork_res.pid;
        tracked.pids.insert(child_pid_);
    }

    // Also done in the child; doing it here too means killpg works even if the child hasn't run yet.
    // Fails harmlessly once the child has exec'd.
    if (::setpgid(child_pid_, child_pid_) == -1) {
        LOG_TRACE("setpgid({}) from parent: {}", child_pid_, get_err_msg());
    }

    close_fd(status_pipe.write_fd);

    // Blocks until the child either execs (EOF, since the write end is close-on-exec) or reports a failure
    std::string status_bytes;
    while (status_bytes.size() < sizeof(ChildFailure)) {
        auto res = linux::read(status_pipe.read_fd, sizeof(ChildFailure) - status_bytes.size());

        if (!res) {
            if (res.error() == std::errc::interrupted) {
                continue;
            }
            return ProcessError{ErrorKind::SyscallFailure, "reading child status pipe failed"};
        }

        if (res->empty()) {
            break;
        }

        status_bytes += *res;
    }

    if (status_bytes.size() == sizeof(ChildFailure)) {
        ChildFailure failure{};
        std::copy_n(status_bytes.data(), sizeof(failure), reinterpret_cast<char*>(&failure)); // NOLINT

        if (auto res = linux::waitpid(child_pid_); !res) {
            LOG_WARN("Could not reap failed child {}: {}", child_pid_, res.error().message());
        }
        mark_reaped();

        std::string detail = fmt::format("{} failed in child: {}", to_string(failure.step), get_err_msg(failure.err));
        LOG_DEBUG("Child {} could not be set up: {}", child_pid_, detail);

        using enum ChildStep;
        ErrorKind kind = ErrorKind::SandboxFailure;

        if (failure.step == Exec) {
            kind = ErrorKind::SpawnFailure;
        } else if (failure.step == Chdir) {
            kind = ErrorKind::NotFound;
        }

        return ProcessError{kind, std::move(detail)};
    }

    TRYE(set_nonblocking(pipes_.stdout_read), SyscallFailure);
    TRYE(set_nonblocking(pipes_.stderr_read), SyscallFailure);
    TRYE(set_nonblocking(pipes_.stdin_write), SyscallFailure);

    LOG_DEBUG("Started child {} : {}", child_pid_, request_.argv);

    return {};
}

Result<void> Subprocess::kill_group() {
    if (child_pid_ == 0) {
        return {};
    }

    auto res = linux::killpg(child_pid_, SIGKILL);

    // The group is already gone
    if (!res && res.error() == std::errc::no_such_process) {
        return {};
    }

    TRYE(res, SyscallFailure);

    return {};
}

void Subprocess::mark_reaped() {
    reaped_ = true;
    untrack_child(child_pid_);

    collect_stray_descendants();
}

void Subprocess::close_pipes() {
    close_fd(pipes_.stdin_write);
    close_fd(pipes_.stdout_read);
    close_fd(pipes_.stderr_read);
}

ProcessResult<CapturedRun> Subprocess::communicate() {
    using std::chrono::steady_clock;

    ASSERT(child_pid_ != 0 && !reaped_, "communicate() requires a started, uncollected process");

    BoundedBuffer stdout_buf{request_.max_output};
    BoundedBuffer stderr_buf{request_.max_output};

    std::string_view pending_stdin = request_.stdin_data ? std::string_view{*request_.stdin_data} : "";
    if (pending_stdin.empty()) {
        close_fd(pipes_.stdin_write);
    }

    const auto deadline = start_time_ + request_.timeout;
    std::optional<steady_clock::time_point> drain_deadline;

    bool timed_out = false;
    int wait_status = 0;
    steady_clock::time_point end_time;

    while (true) {
        if (!reaped_) {
            auto wait_res = linux::waitpid(child_pid_, WNOHANG);

            if (!wait_res) {
                return ProcessError{ErrorKind::SyscallFailure, wait_res.error().message()};
            }

            if (wait_res->pid == child_pid_) {
                end_time = steady_clock::now();
                wait_status = wait_res->status;

                // Stragglers in the group (or detached from it) would otherwise keep the output pipes open
                std::ignore = kill_group();
                mark_reaped();
                drain_deadline = end_time + DRAIN_GRACE;
            } else if (steady_clock::now() >= deadline) {
                LOG_DEBUG("Child {} exceeded its {} deadline; killing its process group", child_pid_,
                          request_.timeout);

                timed_out = true;
                TRYE(kill_group(), SyscallFailure);

                auto killed_res = TRYE(linux::waitpid(child_pid_), SyscallFailure);
                end_time = steady_clock::now();
                mark_reaped();
                wait_status = killed_res.status;

                drain_deadline = end_time + DRAIN_GRACE;
            }
        }

        bool outputs_closed = pipes_.stdout_read == -1 && pipes_.stderr_read == -1;

        if (reaped_ && (outputs_closed || steady_clock::now() >= *drain_deadline)) {
            break;
        }

        std::vector<pollfd> poll_fds;

        if (pipes_.stdout_read != -1) {
            poll_fds.push_back({.fd = pipes_.stdout_read, .events = POLLIN, .revents = 0});
        }
        if (pipes_.stderr_read != -1) {
            poll_fds.push_back({.fd = pipes_.stderr_read, .events = POLLIN, .revents = 0});
        }
        if (pipes_.stdin_write != -1) {
            poll_fds.push_back({.fd = pipes_.stdin_write, .events = POLLOUT, .revents = 0});
        }

        if (poll_fds.empty()) {
            // Nothing to do but wait for the child to exit
            ::usleep(gsl::narrow_cast<useconds_t>(
                std::chrono::duration_cast<std::chrono::microseconds>(POLL_INTERVAL).count()));
            continue;
        }

        TRYE(linux::poll(poll_fds, gsl::narrow_cast<int>(POLL_INTERVAL.count())), SyscallFailure);

        drain_available(pipes_.stdout_read, stdout_buf);
        drain_available(pipes_.stderr_read, stderr_buf);

        if (pipes_.stdin_write != -1) {
            auto write_res = linux::write(pipes_.stdin_write, pending_stdin);

            if (write_res) {
                pending_stdin.remove_prefix(*write_res);
            } else if (!is_would_block(write_res.error())) {
                // Most likely EPIPE: the child closed its stdin early. Not an error for the harness
                LOG_DEBUG("Child {} stopped accepting stdin: {}", child_pid_, write_res.error().message());
                pending_stdin = {};
            }

            if (pending_stdin.empty()) {
                close_fd(pipes_.stdin_write);
            }
        }
    }

    close_pipes();

    CapturedRun run{
        .result = timed_out ? RunResult::make_timed_out() : RunResult::from_wait_status(wait_status),
        .stdout_text = stdout_buf.release(),
        .stderr_text = stderr_buf.release(),
        .stdout_truncated = stdout_buf.truncated(),
        .stderr_truncated = stderr_buf.truncated(),
        .duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time_),
    };

    LOG_DEBUG("Child {} {} after {}", child_pid_, run.result, run.duration);

    return run;
}

ProcessResult<CapturedRun> run_subprocess(SpawnRequest request) {
    Subprocess proc{std::move(request)};

    TRY(proc.start());

    return proc.communicate();
}

} // namespace gradebox
