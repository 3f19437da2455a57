#pragma once

#include <exegrader/common/error_types.hpp>
#include <exegrader/common/formatters/debug.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace exegrader {

/// Base of every error the engine raises to its caller, as opposed to failures of the submitted
/// code, which are reported as data in ExecutionResult / TestCaseResult.
class GraderError : public std::runtime_error
{
public:
    GraderError(ErrorKind kind, const std::string& msg)
        : std::runtime_error{msg}
        , kind_{kind} {}

    ErrorKind get_kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/// The requested language has no registered profile
class UnsupportedLanguageError : public GraderError
{
public:
    explicit UnsupportedLanguageError(std::string_view language)
        : GraderError{ErrorKind::UnsupportedLanguage, fmt::format("Unsupported language: {}", language)}
        , language_{language} {}

    const std::string& get_language() const noexcept { return language_; }

private:
    std::string language_;
};

/// The exercise store does not know the requested exercise
class ExerciseNotFoundError : public GraderError
{
public:
    explicit ExerciseNotFoundError(std::string_view exercise_id)
        : GraderError{ErrorKind::ExerciseNotFound, fmt::format("Exercise not found: {}", exercise_id)} {}
};

/// Grading was requested with an empty list of test cases
class NoTestsConfiguredError : public GraderError
{
public:
    explicit NoTestsConfiguredError(std::string_view exercise_id = "")
        : GraderError{ErrorKind::NoTestsConfigured,
                      exercise_id.empty() ? std::string{"No test cases configured"}
                                          : fmt::format("Exercise {} has no tests configured", exercise_id)} {}
};

/// The engine itself failed (e.g., could not create a workspace or fork a process)
class ExecutionError : public GraderError
{
public:
    using GraderError::GraderError;
};

} // namespace exegrader

template <>
struct fmt::formatter<::exegrader::GraderError> : ::exegrader::DebugFormatter
{
    auto format(const ::exegrader::GraderError& from, format_context& ctx) const {
        return format_to(ctx.out(), "{} : {}", from.what(), from.get_kind());
    }
};
