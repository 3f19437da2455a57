#include "output/plaintext_serializer.hpp"

#include "common/terminal_checks.hpp"
#include "common/time.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <exegrader/execution/execution_result.hpp>
#include <exegrader/grading/test_case.hpp>
#include <exegrader/logging.hpp>

#include <fmt/color.h>
#include <fmt/format.h>
#include <gsl/util>

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace exegrader {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_run_metadata(const RunMetadata& data) {
    if (!should_output_run_metadata(verbosity_)) {
        return;
    }

    constexpr std::string_view header_text = " Execution Info ";
    constexpr std::string_view version_label = "Version: ";
    constexpr std::string_view date_label = "Date and Time: ";

    std::string local_timepoint_text = to_localtime_string(data.start_time, "%a %b %d %T %Y").value_or("<ERROR>");

    std::string out = fmt::format("{:#^{}}\n", header_text, terminal_width_);
    out += fmt::format("{}{:>{}}\n", version_label, data.version_string, terminal_width_ - version_label.size());
    out += fmt::format("{}{:>{}}\n", date_label, local_timepoint_text, terminal_width_ - date_label.size());
    out += LINE_DIVIDER_2EM(terminal_width_) + "\n\n";

    sink_.write(out);
}

void PlainTextSerializer::on_submission_begin(const SubmissionInfo& info) {
    current_submission_ = info.path.string();
    ++num_submissions_;

    if (!should_output_submission_header(verbosity_)) {
        return;
    }

    std::string out = fmt::format("{}\nSubmission: {} ({})\n", LINE_DIVIDER_EM(terminal_width_),
                                  style(current_submission_, POP_OUT_STYLE), style(info.language, VALUE_STYLE));

    if (info.exercise_id) {
        out += fmt::format("Exercise: {}\n", style(*info.exercise_id, VALUE_STYLE));
    }

    out += LINE_DIVIDER_EM(terminal_width_) + "\n";

    sink_.write(out);
}

void PlainTextSerializer::on_execution_result(const ExecutionResult& data) {
    if (data.succeeded()) {
        ++num_submissions_passed_;
    }

    // The program's stdout is passed through untouched, so that `run` can be used in pipelines
    if (should_output_program_output(verbosity_) && data.reached_run_step()) {
        sink_.write(data.stdout_data);
    }

    if (!should_output_execution_status(verbosity_)) {
        return;
    }

    std::string out;

    if (!data.stdout_data.empty() && !data.stdout_data.ends_with('\n') && data.reached_run_step()) {
        out += "\n";
    }

    out += LINE_DIVIDER(terminal_width_) + "\n";

    switch (data.outcome) {
    case ExecutionOutcome::Completed:
        out += fmt::format("Exited with code {} after {:.3f}s\n",
                           style(data.exit_code, data.succeeded() ? SUCCESS_STYLE : ERROR_STYLE),
                           data.duration_seconds);
        break;
    case ExecutionOutcome::TimedOut:
        out += fmt::format("{} after {:.3f}s\n", style("Timed out", ERROR_STYLE), data.duration_seconds);
        break;
    case ExecutionOutcome::CompileFailed:
        out += fmt::format("{} (exit code {})\n", style("Compilation failed", ERROR_STYLE), data.exit_code);
        break;
    case ExecutionOutcome::CompileTimedOut:
        out += fmt::format("{}\n", style("Compilation timed out", ERROR_STYLE));
        break;
    case ExecutionOutcome::CompilerNotFound:
    case ExecutionOutcome::CompilerCannotExecute:
        out += fmt::format("{} (exit code {})\n", style("Could not run the compiler", ERROR_STYLE), data.exit_code);
        break;
    case ExecutionOutcome::CommandNotFound:
    case ExecutionOutcome::CannotExecute:
        out += fmt::format("{} (exit code {})\n", style("Could not execute", ERROR_STYLE), data.exit_code);
        break;
    }

    sink_.write(out);

    if (!data.reached_run_step()) {
        write_block("compiler stdout", data.stdout_data);
    }
    write_block("stderr", data.stderr_data);
}

void PlainTextSerializer::on_test_begin(const TestCase& test) {
    if (verbosity_ < VerbosityLevel::Extra) {
        return;
    }

    sink_.write(fmt::format("Running test {}{}...\n", test.id, test.is_hidden ? " (hidden)" : ""));
}

void PlainTextSerializer::on_test_result(const TestCaseResult& data) {
    if (!should_output_test(verbosity_, data.passed)) {
        return;
    }

    std::string result_str = data.passed ? style_str("PASSED", SUCCESS_STYLE) : style_str("FAILED", ERROR_STYLE);

    std::string out = fmt::format("Test {:<4} : {} (exit code {}, {:.3f}s)\n", data.test_id, result_str,
                                  style(data.exit_code, VALUE_STYLE), data.duration_seconds);
    sink_.write(out);

    if (!should_output_test_details(verbosity_, data.passed)) {
        return;
    }

    if (data.is_hidden) {
        write_block("input", REDACTED);
        write_block("expected output", REDACTED);
    } else {
        write_block("input", data.input_data.value_or(""));
        write_block("expected output", data.expected_output);
    }

    write_block("actual output", data.stdout_data);
    write_block("stderr", data.stderr_data);
}

void PlainTextSerializer::on_verdict(const GradingVerdict& data, std::size_t num_tests) {
    if (data.passed_all) {
        ++num_submissions_passed_;
    }

    if (!should_output_verdict(verbosity_)) {
        return;
    }

    const int num_run = gsl::narrow_cast<int>(data.results.size());
    const int num_total = gsl::narrow_cast<int>(num_tests);

    // Short form: a single line per submission
    if (!should_output_submission_header(verbosity_)) {
        std::string status = data.passed_all ? style_str("PASSED", SUCCESS_STYLE) : style_str("FAILED", ERROR_STYLE);
        sink_.write(fmt::format("{}: {} ({}/{} {} passed)\n", style(current_submission_, POP_OUT_STYLE), status,
                                data.num_passed(), num_total, pluralize("test", num_total)));
        return;
    }

    std::string out = LINE_DIVIDER(terminal_width_) + "\n";

    // Mostly copying Catch2's result summary format, so credit to them for the following
    if (data.passed_all && num_run == num_total) {
        out += fmt::format("{} ({} {})\n", style("All tests passed", SUCCESS_STYLE), num_total,
                           pluralize("test", num_total));
        sink_.write(out);
        return;
    }

    static constexpr std::size_t field_width = 12;

    std::string total_msg = fmt::format("{} total", num_total);
    std::string passed_msg = fmt::format("{} passed", data.num_passed());
    std::string failed_msg = fmt::format("{} failed", data.num_failed());

    out += fmt::format("{0:<{4}}: {1:>{4}} | {2:>{4}} | {3:>{4}}\n", "Tests", total_msg,
                       style(passed_msg, SUCCESS_STYLE), style(failed_msg, ERROR_STYLE), field_width);

    if (num_run < num_total) {
        out += fmt::format("Stopped after test {}; {} {} not run\n", data.results.back().test_id, num_total - num_run,
                           pluralize("test", num_total - num_run));
    }

    sink_.write(out);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    sink_.write(fmt::format("{}\n", style(what, WARNING_STYLE)));
}

void PlainTextSerializer::on_error(std::string_view what) {
    sink_.write(fmt::format("{}\n", style(what, ERROR_STYLE)));
}

void PlainTextSerializer::finalize() {
    if (num_submissions_ > 1 && should_output_verdict(verbosity_)) {
        std::string out = fmt::format("{}\n{}/{} submissions passed all tests\n", LINE_DIVIDER_2EM(terminal_width_),
                                      num_submissions_passed_, num_submissions_);
        sink_.write(out);
    }

    sink_.flush();
}

void PlainTextSerializer::write_block(std::string_view label, std::string_view text) {
    if (text.empty()) {
        return;
    }

    std::string out = fmt::format("  {}:\n", style(label, VALUE_STYLE));

    // A trailing newline does not start another line
    std::string_view rest = text;
    if (rest.ends_with('\n')) {
        rest.remove_suffix(1);
    }

    while (true) {
        const auto newline = rest.find('\n');
        out += fmt::format("    | {}\n", rest.substr(0, newline));

        if (newline == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(newline + 1);
    }

    sink_.write(out);
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::string PlainTextSerializer::pluralize(std::string_view root, int count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return std::size_t{size.ws_col}; });

    if (width.has_error()) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error().message(),
                  DEFAULT_WIDTH);
    }

    const std::size_t result = width.value_or(DEFAULT_WIDTH);

    return result == 0 ? DEFAULT_WIDTH : result;
}

} // namespace exegrader
