#pragma once

#include <exegrader/common/class_traits.hpp>
#include <exegrader/common/expected.hpp>
#include <exegrader/language/language_registry.hpp>

#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <argparse/argparse.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace exegrader {

/// Just a wrapper around argparse for now.
/// Subcommand parsers refer to each other, hence not movable.
class CommandLineArgs : NonMovable
{
public:
    CommandLineArgs(std::span<const char*> args, const LanguageRegistry& registry);

    /// Returns:
    ///   Success - Expected<ProgramOptions> with parsed program options structure
    ///   Failure - Expected<std::string> with failure message
    Expected<ProgramOptions, std::string> parse();

    std::string usage_message() const;

    /// Help of the subcommand that was used, or of the whole program if none was
    std::string help_message() const;

private:
    /// Set up the ArgumentParser for fields of ProgramOptions
    void setup_parser();

    /// Flags understood by every subcommand
    void add_common_arguments(argparse::ArgumentParser& parser);

    void setup_run_parser();
    void setup_grade_parser();

    /// Move the parsed argument buffers into `opts_buffer_`
    void collect_buffers();

    /// Obtain the basename of a full pathname
    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

    const LanguageRegistry* registry_;

    argparse::ArgumentParser arg_parser_;
    argparse::ArgumentParser run_parser_;
    argparse::ArgumentParser grade_parser_;
    argparse::ArgumentParser languages_parser_;

    std::vector<std::string> args_;

    ProgramOptions opts_buffer_ = {};

    // argparse can only store into plain types
    std::vector<std::string> files_buffer_;
    std::string language_buffer_;
    std::string stdin_file_buffer_;
    int timeout_buffer_ = 0;
    std::string tests_dir_buffer_;
    bool no_short_circuit_buffer_ = false;

    using VerbosityLevelUnderlyingT = std::underlying_type_t<VerbosityLevel>;
};

/// Parses `args`, printing the error and help message and exiting with `exit_code` on failure
ProgramOptions parse_args_or_exit(std::span<const char*> args, const LanguageRegistry& registry,
                                  int exit_code = 2) noexcept;

} // namespace exegrader
