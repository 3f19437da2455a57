#pragma once

#include <exegrader/common/expected.hpp>
#include <exegrader/common/formatters/debug.hpp>
#include <exegrader/common/formatters/enum.hpp>
#include <exegrader/language/language_registry.hpp>

#include "output/verbosity.hpp"

#include <boost/describe/enum.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace exegrader {

struct ProgramOptions
{
    // ###### Argument fields

    enum class Command { Run, Grade, Languages };
    BOOST_DESCRIBE_NESTED_ENUM(Command, Run, Grade, Languages);

    Command command = Command::Languages;

    /// Level of verbosity for cli output. See \ref VerbosityLevel
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    enum class ColorizeOpt { Auto, Always, Never };
    BOOST_DESCRIBE_NESTED_ENUM(ColorizeOpt, Auto, Always, Never);

    ColorizeOpt colorize_option = ColorizeOpt::Auto;

    /// Submission source files. Exactly one for `run`, at least one for `grade`
    std::vector<std::filesystem::path> files;

    /// Language id; inferred from each file's extension if absent
    std::optional<std::string> language;

    // `run` only
    std::optional<std::filesystem::path> stdin_file;
    std::optional<int> timeout_seconds;

    // `grade` only
    std::string exercise_id;
    std::filesystem::path tests_dir;
    int jobs = DEFAULT_JOBS;
    bool short_circuit = true;
    bool honor_test_timeouts = false;
    std::string student_id = std::string{DEFAULT_STUDENT_ID};

    // ###### Argument defaults

    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;
    static constexpr int DEFAULT_JOBS = 1;
    static constexpr std::string_view DEFAULT_STUDENT_ID = "anonymous";

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                           fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_directory(path)) {
            return (fmt::format(fmt, path.string()) + " is not a directory");
        }

        return {};
    }

    /// The profile for `file`: the one of the explicit `language` if given, otherwise the one matching its extension
    Expected<std::reference_wrapper<const LanguageProfile>, std::string>
    profile_for(const std::filesystem::path& file, const LanguageRegistry& registry) const {
        if (language) {
            auto profile = registry.resolve(*language);
            if (!profile) {
                return fmt::format("Unsupported language {:?}. Supported: {}", *language,
                                   fmt::join(registry.ids(), ", "));
            }
            return *profile;
        }

        auto profile = registry.find_by_extension(file.extension().string());
        if (!profile) {
            return fmt::format("Cannot infer the language of {:?} from its extension; use --language",
                               file.string());
        }

        return *profile;
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate(const LanguageRegistry& registry) const {
        if (command == Command::Languages) {
            return {};
        }

        if (files.empty()) {
            return std::string{"No submission file given"};
        }

        for (const auto& file : files) {
            TRY(ensure_is_regular_file(file, "Submission file {:?}"));
            TRY(profile_for(file, registry));
        }

        if (command == Command::Run) {
            if (files.size() != 1) {
                return std::string{"`run` takes exactly one submission file"};
            }

            if (stdin_file) {
                TRY(ensure_is_regular_file(*stdin_file, "Input file {:?}"));
            }

            if (timeout_seconds && *timeout_seconds < 1) {
                return fmt::format("Timeout must be at least 1 second (got {})", *timeout_seconds);
            }

            return {};
        }

        if (exercise_id.empty()) {
            return std::string{"No exercise id given"};
        }

        TRY(ensure_is_directory(tests_dir, "Tests directory {:?}"));

        if (jobs < 1) {
            return fmt::format("Number of jobs must be at least 1 (got {})", jobs);
        }

        return {};
    }
};

} // namespace exegrader

template <>
struct fmt::formatter<::exegrader::ProgramOptions> : ::exegrader::DebugFormatter
{
    auto format(const ::exegrader::ProgramOptions& from, fmt::format_context& ctx) const {
        auto out = fmt::format_to(ctx.out(), "{{command={}, verbosity={}, color_opt={}, num_files={}, language={}",
                                  from.command, from.verbosity, from.colorize_option, from.files.size(),
                                  from.language.value_or("<inferred>"));

        switch (from.command) {
        case ::exegrader::ProgramOptions::Command::Run:
            out = fmt::format_to(out, ", stdin_file={}, timeout={}",
                                 from.stdin_file ? from.stdin_file->string() : std::string{"<none>"},
                                 from.timeout_seconds.value_or(0));
            break;
        case ::exegrader::ProgramOptions::Command::Grade:
            out = fmt::format_to(out,
                                 ", exercise={}, tests_dir={}, jobs={}, short_circuit={}, honor_test_timeouts={}, "
                                 "student={}",
                                 from.exercise_id, from.tests_dir.string(), from.jobs, from.short_circuit,
                                 from.honor_test_timeouts, from.student_id);
            break;
        case ::exegrader::ProgramOptions::Command::Languages:
            break;
        }

        return fmt::format_to(out, "}}");
    }
};
