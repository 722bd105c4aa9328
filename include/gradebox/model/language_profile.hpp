#pragma once

#include <gradebox/common/formatters.hpp>

#include <boost/describe/enum.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace gradebox {

// NOLINTNEXTLINE
enum class LanguageKind { Interpreted, Compiled };

BOOST_DESCRIBE_ENUM(LanguageKind, Interpreted, Compiled);

/// Word size the compiler targets. Native adds no flag
// NOLINTNEXTLINE
enum class TargetArch { Native, Bits32, Bits64 };

BOOST_DESCRIBE_ENUM(TargetArch, Native, Bits32, Bits64);

/// Wraps each test invocation in a memory checker (valgrind by default)
struct MemoryCheckConfig
{
    bool enabled = false;

    std::string tool = "valgrind";
    std::vector<std::string> tool_args = {"--leak-check=full", "--errors-for-leak-kinds=definite"};

    /// Passed as --error-exitcode; seeing it back means the checker found a violation
    int error_exit_code = 99;
};

struct LanguageProfile
{
    LanguageKind kind = LanguageKind::Interpreted;

    std::string compiler = "g++";
    TargetArch target = TargetArch::Native;
    std::vector<std::string> flags = {"-O0", "-g"};

    /// Files with these extensions anywhere under the submission are compiled, in sorted order
    std::vector<std::string> source_extensions = {".c", ".cc", ".cpp", ".cxx"};

    /// Artifact name, relative to the submission directory
    std::string output = "a.out";

    /// Replaces the compiler invocation entirely when non-empty (e.g. ``make``)
    std::vector<std::string> command;

    std::chrono::milliseconds build_timeout = std::chrono::seconds{60};

    MemoryCheckConfig memory_check;

    bool requires_build() const noexcept { return kind == LanguageKind::Compiled; }
};

} // namespace gradebox
