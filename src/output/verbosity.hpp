#pragma once

#include <gradebox/common/formatters.hpp>

#include <boost/describe/enum.hpp>

namespace gradebox {

/// How much the human-readable console output shows. The result file is unaffected
// NOLINTNEXTLINE
enum class VerbosityLevel {
    Silent,  ///< Nothing at all
    Quiet,   ///< Final score only
    Summary, ///< Failing tests and the run summary
    All,     ///< Every test and the run summary
    Extra,   ///< Every test with its feedback output
    Max      ///< Everything, including run metadata
};

BOOST_DESCRIBE_ENUM(VerbosityLevel, Silent, Quiet, Summary, All, Extra, Max);

constexpr bool should_output_test(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return level >= All || (level >= Summary && !passed);
}

constexpr bool should_output_test_details(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Extra;
}

constexpr bool should_output_summary(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

constexpr bool should_output_score(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Quiet;
}

constexpr bool should_output_run_metadata(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Max;
}

} // namespace gradebox
