#include "subprocess/run_result.hpp"

#include <gradebox/common/linux.hpp>

#include <fmt/format.h>

#include <string>

#include <sys/wait.h>

namespace gradebox {

RunResult::RunResult(Kind kind, int code)
    : kind_{kind}
    , code_{code} {}

RunResult RunResult::make_exited(int code) {
    return {Kind::Exited, code};
}

RunResult RunResult::make_signaled(int signal_num) {
    return {Kind::Signaled, signal_num};
}

RunResult RunResult::make_timed_out() {
    return {Kind::TimedOut, 0};
}

RunResult RunResult::from_wait_status(int status) {
    if (WIFSIGNALED(status)) {
        return make_signaled(WTERMSIG(status));
    }

    return make_exited(WEXITSTATUS(status));
}

RunResult::Kind RunResult::get_kind() const {
    return kind_;
}

int RunResult::get_code() const {
    return code_;
}

std::string RunResult::describe() const {
    switch (kind_) {
    case Kind::Exited:
        return fmt::format("exited with code {}", code_);
    case Kind::Signaled:
        return fmt::format("killed by {}", linux::Signal{code_});
    case Kind::TimedOut:
        return "timed out";
    }

    return "<unknown>";
}

} // namespace gradebox
