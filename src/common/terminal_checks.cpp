#include "common/terminal_checks.hpp"

#include <gradebox/common/expected.hpp>

#include <range/v3/algorithm/any_of.hpp>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <sys/ioctl.h>
#include <unistd.h>

namespace gradebox {

// Same heuristic spdlog uses for its color sinks
bool is_color_terminal() noexcept {
    static const bool RESULT = [] {
        if (std::getenv("COLORTERM") != nullptr) {
            return true;
        }

        static constexpr std::array<const char*, 16> TERMS = {{"ansi", "color", "console", "cygwin", "gnome", "konsole",
                                                               "kterm", "linux", "msys", "putty", "rxvt", "screen",
                                                               "vt100", "xterm", "alacritty", "vt102"}};

        const char* env_term = std::getenv("TERM");
        if (env_term == nullptr) {
            return false;
        }

        return ranges::any_of(TERMS, [env_term](const char* term) { return std::strstr(env_term, term) != nullptr; });
    }();

    return RESULT;
}

bool in_terminal(FILE* file) noexcept {
    return ::isatty(::fileno(file)) != 0;
}

Expected<winsize> terminal_size(FILE* file) noexcept {
    winsize size{};

    if (::ioctl(::fileno(file), TIOCGWINSZ, &size) == -1) {
        return std::error_code{errno, std::generic_category()};
    }

    return size;
}

} // namespace gradebox
