#pragma once

#include <gradebox/model/build_result.hpp>
#include <gradebox/model/report.hpp>
#include <gradebox/model/test_outcome.hpp>

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace gradebox {

/// PASSED / FAILED lines per test, then the run summary
class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity);

    void on_run_metadata(const RunMetadata& data) override;
    void on_build_result(const BuildResult& data) override;
    void on_test_result(const TestOutcome& data) override;
    void on_report(const Report& data) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;

    /// Plural unless ``count == 1``
    ///
    /// Examples:
    ///  pluralize("test", 0) => "tests"
    ///  pluralize("test", 1) => "test"
    static std::string pluralize(std::string_view root, int count, std::string_view suffix = "s");

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    template <typename T>
    auto style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style));

    template <typename T>
    std::string style_str(const T& arg, fmt::text_style style) const;

    std::string status_label(TestStatus status) const;

    //   error    - FAILED / ERRORED / TIMED OUT
    //   success  - PASSED
    //   value    - points and scores
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto MUTED_STYLE = fmt::fg(fmt::color::gray);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static constexpr auto MAKE_LINE_DIVIDER = [](char chr) {
        return [chr](std::size_t len) { return std::string(len, chr); };
    };

    static const inline auto LINE_DIVIDER = MAKE_LINE_DIVIDER('-');
    static const inline auto LINE_DIVIDER_EM = MAKE_LINE_DIVIDER('=');

    bool do_colorize_;
    std::size_t terminal_width_;

    int num_hidden_seen_ = 0;
};

template <typename T>
auto PlainTextSerializer::style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style)) {
    if (!do_colorize_) {
        return fmt::styled(arg, {});
    }
    return fmt::styled(arg, style);
}

template <typename T>
std::string PlainTextSerializer::style_str(const T& arg, fmt::text_style style) const {
    if (!do_colorize_) {
        return fmt::format("{}", arg);
    }
    return fmt::format(style, "{}", arg);
}

} // namespace gradebox
