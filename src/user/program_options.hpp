#pragma once

#include <gradebox/common/expected.hpp>
#include <gradebox/common/formatters.hpp>

#include "output/verbosity.hpp"

#include <boost/describe/enum.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <string>

namespace gradebox {

/// Options given on the command line. Everything about *what* to grade comes from the environment
/// instead (see HarnessConfig)
struct ProgramOptions
{
    /// Console output only; the result file is always complete
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    // NOLINTNEXTLINE
    enum class ColorizeOpt { Auto, Always, Never };
    BOOST_DESCRIBE_NESTED_ENUM(ColorizeOpt, Auto, Always, Never)

    ColorizeOpt colorize_option = ColorizeOpt::Auto;

    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    /// Verify that all fields are valid
    Expected<void, std::string> validate() {
        // Repeated -v / -q may overshoot; clamp rather than fail
        verbosity = std::clamp(verbosity, VerbosityLevel::Silent, VerbosityLevel::Max);

        return {};
    }
};

} // namespace gradebox

template <>
struct fmt::formatter<::gradebox::ProgramOptions> : fmt::formatter<std::string>
{
    auto format(const ::gradebox::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{{verbosity={}, color_opt={}}}", from.verbosity, from.colorize_option);
    }
};
