#include "output/plaintext_serializer.hpp"

#include <gradebox/logging.hpp>

#include "common/terminal_checks.hpp"
#include "common/time.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace gradebox {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_run_metadata(const RunMetadata& data) {
    if (!should_output_run_metadata(verbosity_)) {
        return;
    }

    constexpr std::string_view version_label = "Version: ";
    constexpr std::string_view date_label = "Date and Time: ";

    std::string local_timepoint_text = to_localtime_string(data.start_time, "%a %b %d %T %Y").value_or("<ERROR>");

    std::string out = fmt::format("{:=^{}}\n", " gradebox ", terminal_width_);
    out += fmt::format("{}{:>{}}\n", version_label, data.version_string, terminal_width_ - version_label.size());
    out += fmt::format("{}{:>{}}\n", date_label, local_timepoint_text, terminal_width_ - date_label.size());
    out += LINE_DIVIDER_EM(terminal_width_) + "\n\n";

    sink_.write(out);
}

void PlainTextSerializer::on_build_result(const BuildResult& data) {
    if (!should_output_summary(verbosity_)) {
        return;
    }

    if (data.succeeded()) {
        if (should_output_test_details(verbosity_) && !data.get_diagnostics().empty()) {
            sink_.write(fmt::format("Build {}\n{}\n\n", style_str("succeeded", SUCCESS_STYLE), data.get_diagnostics()));
        }
        return;
    }

    sink_.write(fmt::format("Build {}\n{}\n\n", style_str("FAILED", ERROR_STYLE), data.get_diagnostics()));
}

void PlainTextSerializer::on_test_result(const TestOutcome& data) {
    // Counted before any verbosity filtering so that numbering matches the result file
    const int hidden_index = data.hidden ? ++num_hidden_seen_ : 0;

    if (!should_output_test(verbosity_, data.passed() || data.status == TestStatus::Skipped)) {
        return;
    }

    // Hidden tests show only their status and points, as in the result file
    std::string name = data.hidden ? hidden_test_name(hidden_index) : data.name;

    std::string points_text = data.scored ? fmt::format("{:g}/{:g}", data.points, data.max_points) : "unscored";

    std::string out = fmt::format("{} {} [{}, {}]\n", status_label(data.status), name, style(points_text, VALUE_STYLE),
                                  style(fmt::format("{}", data.duration), MUTED_STYLE));

    if (should_output_test_details(verbosity_) && !data.hidden && !data.output.empty()) {
        out += fmt::format("{}\n{}\n{}\n", LINE_DIVIDER(terminal_width_), data.output, LINE_DIVIDER(terminal_width_));
    }

    sink_.write(out);
}

void PlainTextSerializer::on_report(const Report& data) {
    if (should_output_summary(verbosity_)) {
        std::string out = fmt::format("{}\n", LINE_DIVIDER_EM(terminal_width_));

        if (!data.gradable) {
            out += style_str("Submission could not be graded", ERROR_STYLE) + "\n";
            out += data.output + "\n";
        } else {
            const int num_tests = static_cast<int>(data.tests.size());

            if (data.status == OverallStatus::Passed) {
                out += fmt::format("{} ({} {})\n", style_str("All tests passed", SUCCESS_STYLE), num_tests,
                                   pluralize("test", num_tests));
            } else {
                const int num_failed = data.num_unsuccessful();
                out += fmt::format("{} {} of {} did not pass\n", style(num_failed, ERROR_STYLE),
                                   pluralize("test", num_failed), num_tests);
            }

            out += data.message;
        }

        sink_.write(out);
        return;
    }

    if (should_output_score(verbosity_)) {
        sink_.write(fmt::format("{:.2f}% ({:g}/{:g} points)\n", data.score * 100.0, data.points, data.max_points));
    }
}

void PlainTextSerializer::on_warning(std::string_view what) {
    if (verbosity_ == VerbosityLevel::Silent) {
        return;
    }
    sink_.write(style_str(what, WARNING_STYLE) + "\n");
}

void PlainTextSerializer::on_error(std::string_view what) {
    if (verbosity_ == VerbosityLevel::Silent) {
        return;
    }
    sink_.write(style_str(what, ERROR_STYLE) + "\n");
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

std::string PlainTextSerializer::pluralize(std::string_view root, int count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

std::string PlainTextSerializer::status_label(TestStatus status) const {
    using enum TestStatus;

    switch (status) {
    case Passed:
        return style_str("PASSED   ", SUCCESS_STYLE);
    case Failed:
        return style_str("FAILED   ", ERROR_STYLE);
    case Errored:
        return style_str("ERRORED  ", ERROR_STYLE);
    case TimedOut:
        return style_str("TIMED OUT", ERROR_STYLE);
    case Skipped:
        return style_str("SKIPPED  ", WARNING_STYLE);
    case BuildError:
        return style_str("BUILD ERR", ERROR_STYLE);
    }

    return fmt::format("{}", status);
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return std::size_t{size.ws_col}; });

    if (!width || width.value() == 0) {
        LOG_DEBUG("Could not obtain terminal width. Defaulting to {}", DEFAULT_WIDTH);
        return DEFAULT_WIDTH;
    }

    return std::min<std::size_t>(width.value(), 160);
}

} // namespace gradebox
