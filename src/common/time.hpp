#pragma once

#include <gradebox/common/expected.hpp>
#include <gradebox/logging.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <string>
#include <system_error>

namespace gradebox {

/// Local wall-clock rendering of ``time_point`` with strftime(3)
__attribute__((format(strftime, 2, 0))) inline Expected<std::string>
to_localtime_string(std::chrono::system_clock::time_point time_point, const char* format = "%Y-%m-%d %H:%M:%S") {
    std::time_t time = std::chrono::system_clock::to_time_t(time_point);
    std::tm tm_buf{};

    if (localtime_r(&time, &tm_buf) != &tm_buf) {
        auto err = errno;
        LOG_WARN("localtime_r failed: {}", get_err_msg(err));
        return std::error_code{err, std::generic_category()};
    }

    std::array<char, 256> buf{};

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
    std::size_t num_chars = std::strftime(buf.data(), buf.size(), format, &tm_buf);
#pragma GCC diagnostic pop

    if (num_chars == 0) {
        LOG_WARN("strftime could not format a time point with {:?}", format);
        return std::make_error_code(std::errc::value_too_large);
    }

    return std::string{buf.data(), num_chars};
}

} // namespace gradebox
