#pragma once

#include <gradebox/common/formatters.hpp>

#include <boost/describe/enum.hpp>

#include <chrono>
#include <string>

namespace gradebox {

/// How a child process ended
class RunResult
{
public:
    // NOLINTNEXTLINE
    enum class Kind { Exited, Signaled, TimedOut };
    BOOST_DESCRIBE_NESTED_ENUM(Kind, Exited, Signaled, TimedOut)

    static RunResult make_exited(int code);
    static RunResult make_signaled(int signal_num);
    static RunResult make_timed_out();

    /// Decode a status as reported by waitpid(2)
    static RunResult from_wait_status(int status);

    Kind get_kind() const;

    /// Exit code if Exited, signal number if Signaled, 0 otherwise
    int get_code() const;

    bool exited_with(int code) const { return kind_ == Kind::Exited && code_ == code; }

    /// e.g. "exited with code 1", "killed by SIGSEGV (Segmentation fault)"
    std::string describe() const;

    bool operator==(const RunResult&) const = default;

private:
    RunResult(Kind kind, int code);

    Kind kind_;
    int code_;
};

/// Everything observed about one finished child
struct CapturedRun
{
    RunResult result = RunResult::make_exited(0);

    std::string stdout_text;
    std::string stderr_text;

    bool stdout_truncated = false;
    bool stderr_truncated = false;

    std::chrono::milliseconds duration{};

    bool timed_out() const { return result.get_kind() == RunResult::Kind::TimedOut; }

    bool truncated() const { return stdout_truncated || stderr_truncated; }
};

} // namespace gradebox

template <>
struct fmt::formatter<::gradebox::RunResult> : fmt::formatter<std::string>
{
    auto format(const ::gradebox::RunResult& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(from.describe(), ctx);
    }
};
