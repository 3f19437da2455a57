#include "user/cl_args.hpp"

#include "common/terminal_checks.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"
#include "version.hpp"

#include <exegrader/common/expected.hpp>
#include <exegrader/language/language_registry.hpp>
#include <exegrader/logging.hpp>

#include <argparse/argparse.hpp>
#include <fmt/base.h>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace exegrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args, const LanguageRegistry& registry)
    : registry_{&registry}
    , arg_parser_{get_basename(args[0]), /*unused*/ EXEGRADER_VERSION_STRING, argparse::default_arguments::help}
    , run_parser_{"run", EXEGRADER_VERSION_STRING, argparse::default_arguments::help}
    , grade_parser_{"grade", EXEGRADER_VERSION_STRING, argparse::default_arguments::help}
    , languages_parser_{"languages", EXEGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

void CommandLineArgs::setup_parser() {
    std::size_t max_width = 80;
    if (auto term_sz = terminal_size(stdout)) {
        max_width = term_sz->ws_col * 3 / 4;
        LOG_DEBUG("Cols = {}, px = {}", term_sz->ws_col, term_sz->ws_xpixel);
    } else {
        LOG_DEBUG("Failed to get terminal size. Setting max width to {}", max_width);
    }

    for (argparse::ArgumentParser* parser : {&arg_parser_, &run_parser_, &grade_parser_, &languages_parser_}) {
        parser->set_usage_max_line_width(max_width);
    }

    arg_parser_.add_description(fmt::format("ExeGrader v{}", EXEGRADER_VERSION_STRING));

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto& /*unused*/) {
            fmt::println(EXEGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    setup_run_parser();
    setup_grade_parser();

    languages_parser_.add_description("List the supported languages");
    add_common_arguments(languages_parser_);

    arg_parser_.add_subparser(run_parser_);
    arg_parser_.add_subparser(grade_parser_);
    arg_parser_.add_subparser(languages_parser_);
}

void CommandLineArgs::add_common_arguments(argparse::ArgumentParser& parser) {
    using enum VerbosityLevel;

    constexpr auto DEFAULT_VERBOSITY_VALUE =
        static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
    constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Max);
    constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

    constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
    constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

    // clang-format off
    parser.add_argument("-v", "--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                if (value > MAX_VERBOSITY_VALUE) {
                    throw std::invalid_argument("Verbosity specification exceeds maximum level");
                }

                opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
            })
        .append()
        .help(fmt::format("Increase verbosity level (up to {}x)", MAX_VERBOSITY_INCREASE));

    parser.add_argument("-q", "--quiet")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                if (value < MIN_VERBOSITY_VALUE) {
                    throw std::invalid_argument("Verbosity specification is lower than minimum level");
                }

                opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
            })
        .append()
        .help(fmt::format("Decrease verbosity level (up to {}x)", MAX_VERBOSITY_DECREASE));

    parser.add_argument("--silent")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.verbosity = Silent;
            })
        .help("Sets verbosity level to 'Silent', suppressing all output except for the return code. Useful for scripting.");

    parser.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
            });
    // clang-format on
}

void CommandLineArgs::setup_run_parser() {
    run_parser_.add_description("Compile (if needed) and run a single source file, passing its output through");

    // clang-format off
    run_parser_.add_argument("file")
        .nargs(1)
        .store_into(files_buffer_)
        .help("The source file to run");

    run_parser_.add_argument("-l", "--language")
        .metavar("LANG")
        .store_into(language_buffer_)
        .help(fmt::format("Language of the file; inferred from its extension if not given\nOne of: {}",
                          fmt::join(registry_->ids(), ", ")));

    run_parser_.add_argument("--stdin")
        .metavar("FILE")
        .store_into(stdin_file_buffer_)
        .help("File whose contents are fed to the program's standard input");

    run_parser_.add_argument("--timeout")
        .metavar("SECS")
        .store_into(timeout_buffer_)
        .help("Override the language's timeout (whole seconds)");
    // clang-format on

    add_common_arguments(run_parser_);
}

void CommandLineArgs::setup_grade_parser() {
    grade_parser_.add_description("Grade one or more source files against the test cases of an exercise");

    // clang-format off
    grade_parser_.add_argument("files")
        .nargs(argparse::nargs_pattern::at_least_one)
        .store_into(files_buffer_)
        .help("The source files to grade; each is an independent submission");

    grade_parser_.add_argument("-e", "--exercise")
        .metavar("EXERCISE_ID")
        .required()
        .store_into(opts_buffer_.exercise_id)
        .help("The exercise whose test cases are run");

    grade_parser_.add_argument("--tests")
        .metavar("DIR")
        .required()
        .store_into(tests_dir_buffer_)
        .help("Root directory of the exercises, with one subdirectory of test files per exercise.\n"
              "See docs for the layout.");

    grade_parser_.add_argument("-l", "--language")
        .metavar("LANG")
        .store_into(language_buffer_)
        .help(fmt::format("Language of the files; inferred from each file's extension if not given\nOne of: {}",
                          fmt::join(registry_->ids(), ", ")));

    grade_parser_.add_argument("-j", "--jobs")
        .metavar("N")
        .store_into(opts_buffer_.jobs)
        .help(fmt::format("Number of submissions graded in parallel (default: {})", ProgramOptions::DEFAULT_JOBS));

    grade_parser_.add_argument("--no-short-circuit")
        .flag()
        .store_into(no_short_circuit_buffer_)
        .help("Run every test, even after one has crashed or timed out");

    grade_parser_.add_argument("--honor-test-timeouts")
        .flag()
        .store_into(opts_buffer_.honor_test_timeouts)
        .help("Let a test's own timeout override the language's");

    grade_parser_.add_argument("--student")
        .metavar("ID")
        .store_into(opts_buffer_.student_id)
        .help("Student the progress records are made for");
    // clang-format on

    add_common_arguments(grade_parser_);
}

void CommandLineArgs::collect_buffers() {
    opts_buffer_.files.assign(files_buffer_.begin(), files_buffer_.end());

    if (!language_buffer_.empty()) {
        opts_buffer_.language = language_buffer_;
    }

    if (!stdin_file_buffer_.empty()) {
        opts_buffer_.stdin_file = stdin_file_buffer_;
    }

    if (run_parser_.is_used("--timeout")) {
        opts_buffer_.timeout_seconds = timeout_buffer_;
    }

    opts_buffer_.tests_dir = tests_dir_buffer_;
    opts_buffer_.short_circuit = !no_short_circuit_buffer_;
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return err.what();
    }

    using enum ProgramOptions::Command;

    if (arg_parser_.is_subcommand_used(run_parser_)) {
        opts_buffer_.command = Run;
    } else if (arg_parser_.is_subcommand_used(grade_parser_)) {
        opts_buffer_.command = Grade;
    } else if (arg_parser_.is_subcommand_used(languages_parser_)) {
        opts_buffer_.command = Languages;
    } else {
        return std::string{"No command given"};
    }

    collect_buffers();

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    if (arg_parser_.is_subcommand_used(run_parser_)) {
        return run_parser_.help().str();
    }
    if (arg_parser_.is_subcommand_used(grade_parser_)) {
        return grade_parser_.help().str();
    }

    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, const LanguageRegistry& registry,
                                  int exit_code) noexcept {
    CommandLineArgs cl_args{args, registry};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::println(stderr, "{}\n{}", styled(opts_res.error(), fg(fmt::color::red)), cl_args.help_message());
        std::exit(exit_code);
    }

    if (auto valid = opts_res->validate(registry); !valid) {
        fmt::println(stderr, "{}", styled(valid.error(), fg(fmt::color::red)));
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace exegrader
