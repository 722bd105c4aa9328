#pragma once

#include <gradebox/common/expected.hpp>

#include "user/program_options.hpp"

#include <argparse/argparse.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

/// Thin layer over argparse that fills in ProgramOptions
class CommandLineArgs
{
public:
    explicit CommandLineArgs(std::span<const char*> args);

    /// Returns:
    ///   Success - the parsed program options
    ///   Failure - an error message
    Expected<ProgramOptions, std::string> parse();

    std::string usage_message() const;
    std::string help_message() const;

private:
    /// Set up the ArgumentParser for fields of ProgramOptions
    void setup_parser();

    /// -v / -q; throws std::invalid_argument past either end of VerbosityLevel
    void step_verbosity(int delta);

    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

    argparse::ArgumentParser arg_parser_;
    std::vector<std::string> args_;

    ProgramOptions opts_buffer_ = {};
};

/// Prints the error and help message, then exits with ``exit_code``, if the arguments are invalid
ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code = 2) noexcept;

} // namespace gradebox
