#include "user/cl_args.hpp"

#include <gradebox/common/error_types.hpp>
#include <gradebox/common/expected.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/version.hpp>

#include "common/terminal_checks.hpp"
#include "user/program_options.hpp"

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <range/v3/algorithm/find.hpp>

#include <array>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace gradebox {

namespace {

constexpr std::size_t FALLBACK_USAGE_WIDTH = 80;

using ColorChoice = std::pair<std::string_view, ProgramOptions::ColorizeOpt>;

constexpr std::array<ColorChoice, 3> COLOR_CHOICES{{
    {"never", ProgramOptions::ColorizeOpt::Never},
    {"auto", ProgramOptions::ColorizeOpt::Auto},
    {"always", ProgramOptions::ColorizeOpt::Always},
}};

constexpr auto verbosity_value(VerbosityLevel level) {
    return static_cast<std::underlying_type_t<VerbosityLevel>>(level);
}

} // namespace

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), GRADEBOX_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    setup_parser();
}

void CommandLineArgs::step_verbosity(int delta) {
    const int stepped = verbosity_value(opts_buffer_.verbosity) + delta;

    if (stepped > verbosity_value(VerbosityLevel::Max)) {
        throw std::invalid_argument("Too many -v flags: console output is already at its most verbose");
    }
    if (stepped < verbosity_value(VerbosityLevel::Silent)) {
        throw std::invalid_argument("Too many -q flags: console output is already silent");
    }

    opts_buffer_.verbosity = static_cast<VerbosityLevel>(stepped);
}

void CommandLineArgs::setup_parser() {
    const auto term_sz = terminal_size(stdout);
    arg_parser_.set_usage_max_line_width(term_sz ? term_sz->ws_col * 3 / 4 : FALLBACK_USAGE_WIDTH);

    arg_parser_.add_description(fmt::format("gradebox v{}: runs the instructor test suite against a submission "
                                            "and writes the result file.\nPaths and limits are read from the "
                                            "GRADEBOX_* environment variables.",
                                            GRADEBOX_VERSION_STRING));

    arg_parser_.add_argument("-V", "--version")
        .flag()
        .action([](const std::string& /*unused*/) {
            fmt::print("gradebox {}\n", GRADEBOX_VERSION_STRING);
            std::exit(0);
        })
        .help("print the version and exit");

    const auto more_verbose =
        verbosity_value(VerbosityLevel::Max) - verbosity_value(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
    const auto less_verbose =
        verbosity_value(ProgramOptions::DEFAULT_VERBOSITY_LEVEL) - verbosity_value(VerbosityLevel::Silent);

    arg_parser_.add_argument("-v", "--verbose")
        .flag()
        .append()
        .action([this](const std::string& /*unused*/) { step_verbosity(+1); })
        .help(fmt::format("show more on the console; may be repeated {} times", more_verbose));

    arg_parser_.add_argument("-q", "--quiet")
        .flag()
        .append()
        .action([this](const std::string& /*unused*/) { step_verbosity(-1); })
        .help(fmt::format("show less on the console; may be repeated {} times", less_verbose));

    arg_parser_.add_argument("--silent")
        .flag()
        .action([this](const std::string& /*unused*/) { opts_buffer_.verbosity = VerbosityLevel::Silent; })
        .help("print nothing; the result file and exit code are unaffected");

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .action([this](const std::string& choice) {
            auto found = ranges::find(COLOR_CHOICES, choice, &ColorChoice::first);
            if (found == COLOR_CHOICES.end()) {
                throw std::invalid_argument(fmt::format("Unknown --color value {:?}", choice));
            }
            opts_buffer_.colorize_option = found->second;
        })
        .help("colorize console output: never, auto or always");

    opts_buffer_.verbosity = ProgramOptions::DEFAULT_VERBOSITY_LEVEL;
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    TRY(opts_buffer_.validate());

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    if (auto slash = full_name.rfind('/'); slash != std::string_view::npos) {
        full_name.remove_prefix(slash + 1);
    }
    return std::string{full_name};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto parsed = cl_args.parse();

    if (parsed) {
        return parsed.value();
    }

    fmt::print(stderr, "{}\n\n{}\n", fmt::styled(parsed.error(), fmt::fg(fmt::color::red)), cl_args.help_message());
    std::exit(exit_code);
}

} // namespace gradebox
