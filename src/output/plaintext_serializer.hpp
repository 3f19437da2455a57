#pragma once

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace exegrader {

class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity);

    void on_run_metadata(const RunMetadata& data) override;
    void on_submission_begin(const SubmissionInfo& info) override;
    void on_execution_result(const ExecutionResult& data) override;
    void on_test_begin(const TestCase& test) override;
    void on_test_result(const TestCaseResult& data) override;
    void on_verdict(const GradingVerdict& data, std::size_t num_tests) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;

    /// Shown instead of the input and expected output of hidden tests
    static constexpr std::string_view REDACTED = "<hidden>";

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    /// Writes `text` as an indented, labeled block; lines are kept as is
    void write_block(std::string_view label, std::string_view text);

    template <typename T>
    auto style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style));

    template <typename T>
    std::string style_str(const T& arg, fmt::text_style style) const;

    /// Conditionally make a word singular or plural based on `count`
    /// Singular if and only if `count == 1`
    ///
    /// Examples:
    ///  pluralize("test", 0) => "tests"
    ///  pluralize("test", 1) => "test"
    static std::string pluralize(std::string_view root, int count, std::string_view suffix = "s");

    // Basic styles for different kinds of output:
    //   error    - FAILED messages, fatal errors, etc.
    //   success  - PASSED messages
    //   value    - for literal values (exit codes, languages)
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto POP_OUT_STYLE =
        fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::golden_rod);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static constexpr auto MAKE_LINE_DIVIDER = [](char chr) {
        return [chr](std::size_t len) { return std::string(len, chr); };
    };

    // Basic line dividers to seperate output, parameterized on length
    // Line Divider 2x Emphasized : "#######"...
    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static const inline auto LINE_DIVIDER = MAKE_LINE_DIVIDER('-');
    static const inline auto LINE_DIVIDER_EM = MAKE_LINE_DIVIDER('=');
    static const inline auto LINE_DIVIDER_2EM = MAKE_LINE_DIVIDER('#');

    bool do_colorize_;
    std::size_t terminal_width_;

    /// Submission header of the verdict being built, for the Quiet one-line form
    std::string current_submission_;

    int num_submissions_ = 0;
    int num_submissions_passed_ = 0;
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
    return fmt::format("{}", this->style(arg, style));
}

} // namespace exegrader
