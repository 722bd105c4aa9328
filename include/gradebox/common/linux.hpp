#pragma once

#include <gradebox/common/expected.hpp>
#include <gradebox/logging.hpp>

#include <fmt/format.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pwd.h>
#include <signal.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

/// Thin wrappers around the syscalls the harness process issues. Each returns an ``Expected`` carrying
/// the ``errno`` as a ``std::error_code`` and logs failures at debug level.
///
/// None of these are used between ``fork`` and ``execve`` in a child; see subprocess.cpp for that path.
namespace gradebox::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// Returns the number of bytes written, which may be fewer than ``data.size()``
inline Expected<std::size_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err.message());
        return err;
    }

    return static_cast<std::size_t>(res);
}

/// Writes all of ``data``, retrying on partial writes and EINTR
inline Expected<> write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t res = ::write(fd, data.data(), data.size());

        if (res == -1) {
            if (errno == EINTR) {
                continue;
            }

            auto err = make_error_code(errno);
            LOG_DEBUG("write failed: '{}'", err.message());
            return err;
        }

        data.remove_prefix(static_cast<std::size_t>(res));
    }

    return {};
}

/// reads up to ``count`` bytes from a file descriptor. See read(2)
/// An empty result signals end-of-file
inline Expected<std::string> read(int fd, std::size_t count) { // NOLINT
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_TRACE("read failed: '{}'", err.message());
        return err;
    }

    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see kill(2)
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill({}, {}) failed: '{}'", pid, sig, err.message());
        return err;
    }

    return {};
}

/// Signals every process in the group led by ``pgid``. See killpg(3)
inline Expected<> killpg(pid_t pgid, int sig) {
    int res = ::killpg(pgid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("killpg({}, {}) failed: '{}'", pgid, sig, err.message());
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see open(2)
inline Expected<int> open(const std::string& pathname, int flags, mode_t mode = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("open({:?}) failed: '{}'", pathname, err.message());
        return err;
    }

    return res;
}

/// see fsync(2)
inline Expected<> fsync(int fd) {
    int res = ::fsync(fd);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fsync failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see rename(2)
inline Expected<> rename(const std::string& oldpath, const std::string& newpath) {
    int res = ::rename(oldpath.c_str(), newpath.c_str());

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("rename({:?} -> {:?}) failed: '{}'", oldpath, newpath, err.message());
        return err;
    }

    return {};
}

/// see lchown(2); symlinks themselves are re-owned, never their targets
inline Expected<> lchown(const std::string& pathname, uid_t owner, gid_t group) {
    int res = ::lchown(pathname.c_str(), owner, group);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("lchown({:?}, {}, {}) failed: '{}'", pathname, owner, group, err.message());
        return err;
    }

    return {};
}

/// see fcntl(2)
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());

        return err;
    }

    return res;
}

/// see poll(2)
/// Returns the number of ready descriptors; EINTR is reported as 0 ready
inline Expected<int> poll(std::vector<pollfd>& fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        if (errno == EINTR) {
            return 0;
        }

        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err.message());

        return err;
    }

    return res;
}

struct WaitStatus
{
    pid_t pid; ///< 0 if WNOHANG was given and the child has not changed state
    int status;
};

/// see waitpid(2)
inline Expected<WaitStatus> waitpid(pid_t pid, int options = 0) {
    int status = 0;
    pid_t res{};

    do {
        res = ::waitpid(pid, &status, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitpid({}) failed: '{}'", pid, err.message());

        return err;
    }

    return WaitStatus{.pid = res, .status = status};
}

struct Pipe
{
    int read_fd = -1;
    int write_fd = -1;
};

/// see pipe2(2)
inline Expected<Pipe> pipe2(int flags = 0) {
    std::array<int, 2> fds{-1, -1};

    int res = ::pipe2(fds.data(), flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe2 failed: '{}'", err.message());

        return err;
    }

    return Pipe{.read_fd = fds[0], .write_fd = fds[1]};
}

/// see stat(2)
inline Expected<struct ::stat> stat(const std::string& pathname) {
    struct ::stat data_result{};

    int res = ::stat(pathname.c_str(), &data_result);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("stat({:?}) failed: '{}'", pathname, err.message());

        return err;
    }

    return data_result;
}

/// see fstat(2)
inline Expected<struct ::stat> fstat(int fd) {
    struct ::stat data_result{};

    if (::fstat(fd, &data_result) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fstat({}) failed: '{}'", fd, err.message());

        return err;
    }

    return data_result;
}

/// Orphaned descendants are reparented to the calling process rather than to init.
/// See PR_SET_CHILD_SUBREAPER in prctl(2)
inline Expected<> set_child_subreaper() {
    if (::prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("prctl(PR_SET_CHILD_SUBREAPER) failed: '{}'", err.message());

        return err;
    }

    return {};
}

/// see access(2)
inline bool access(const std::string& pathname, int mode) {
    return ::access(pathname.c_str(), mode) == 0;
}

struct PasswdEntry
{
    std::string name;
    uid_t uid;
    gid_t gid;
    std::string home;
};

/// Looks ``name`` up in the password database. See getpwnam_r(3)
/// A missing entry is reported as ``std::errc::no_such_file_or_directory``
inline Expected<PasswdEntry> getpwnam(const std::string& name) {
    constexpr std::size_t FALLBACK_BUF_SZ = 16384;

    long sysconf_size = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buf(sysconf_size > 0 ? static_cast<std::size_t>(sysconf_size) : FALLBACK_BUF_SZ);

    struct ::passwd entry{};
    struct ::passwd* result = nullptr;

    int res = ::getpwnam_r(name.c_str(), &entry, buf.data(), buf.size(), &result);

    if (res != 0) {
        auto err = make_error_code(res);
        LOG_DEBUG("getpwnam_r({:?}) failed: '{}'", name, err.message());
        return err;
    }

    if (result == nullptr) {
        LOG_DEBUG("getpwnam_r({:?}): no such user", name);
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }

    return PasswdEntry{.name = entry.pw_name, .uid = entry.pw_uid, .gid = entry.pw_gid, .home = entry.pw_dir};
}

/// see geteuid(2); cannot fail, provided for consistency
inline uid_t geteuid() {
    return ::geteuid();
}

/// Value type to behave as a linux signal
class Signal
{
public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Signal(int signal_num)
        : signal_num_{signal_num} {};

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const { return signal_num_; }

    std::string to_string() const {
        const char* abbrev = ::sigabbrev_np(signal_num_);
        const char* descr = ::sigdescr_np(signal_num_);

        if (abbrev == nullptr || descr == nullptr) {
            return fmt::format("signal {}", signal_num_);
        }

        return fmt::format("SIG{} ({})", abbrev, descr);
    }

private:
    int signal_num_;
};

using SignalHandlerT = void (*)(int);

inline Expected<SignalHandlerT> signal(Signal sig, SignalHandlerT handler) {
    SignalHandlerT prev_handler = ::signal(sig, handler);

    if (prev_handler == SIG_ERR) {
        auto err = make_error_code();

        LOG_DEBUG("signal failed: '{}'", err.message());

        return err;
    }

    return prev_handler;
}

} // namespace gradebox::linux

template <>
struct fmt::formatter<::gradebox::linux::Signal> : fmt::formatter<std::string>
{
    template <typename FormatContext>
    auto format(const ::gradebox::linux::Signal& from, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(from.to_string(), ctx);
    }
};
