#pragma once

#include <exegrader/common/formatters/debug.hpp>
#include <exegrader/common/formatters/enum.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/format.h>

#include <string>

namespace exegrader {

/// Exit code reported when an executable could not be found
inline constexpr int EXIT_COMMAND_NOT_FOUND = 127;
/// Exit code reported when an executable was found but could not be executed
inline constexpr int EXIT_CANNOT_EXECUTE = 126;
/// Exit code reported when a step was killed for exceeding its timeout
inline constexpr int EXIT_TIMED_OUT = -1;

/// Appended to the run step's stderr on timeout
inline constexpr const char* EXECUTION_TIMED_OUT_MARKER = "\nExecution timed out.";
/// Appended to the compile step's stderr on timeout
inline constexpr const char* COMPILATION_TIMED_OUT_MARKER = "\nCompilation timed out.";

/// Which path through the compile/run pipeline produced a result.
/// `exit_code` alone is ambiguous (a program killed by SIGHUP also reports -1).
enum class ExecutionOutcome {
    Completed,             ///< The run step ran to completion; exit_code is the program's
    CompileFailed,         ///< The compile step exited non-zero; the run step was not attempted
    CompileTimedOut,       ///< The compile step exceeded the timeout; the run step was not attempted
    CompilerNotFound,      ///< The compiler could not be found; the run step was not attempted
    CompilerCannotExecute, ///< The compiler was found, but exec failed; the run step was not attempted
    CommandNotFound,       ///< The run command could not be found
    CannotExecute,         ///< The run command was found, but exec failed
    TimedOut,              ///< The run step exceeded the timeout and was killed
};
BOOST_DESCRIBE_ENUM(ExecutionOutcome, Completed, CompileFailed, CompileTimedOut, CompilerNotFound,
                    CompilerCannotExecute, CommandNotFound, CannotExecute, TimedOut)

/// Observable behavior of one submission execution.
///
/// Streams are raw, untrimmed output of the step that ended the execution: the compiler's on a
/// compile failure, the program's otherwise.
struct ExecutionResult
{
    std::string stdout_data;
    std::string stderr_data;

    /// 0 on success; the program's exit status; -N when killed by signal N;
    /// 127 if a command was not found; -1 on timeout
    int exit_code{};

    /// Wall-clock time of the run step only; 0.0 if the run step was never attempted
    double duration_seconds{};

    ExecutionOutcome outcome{ExecutionOutcome::Completed};

    bool succeeded() const { return exit_code == 0; }

    bool timed_out() const {
        return outcome == ExecutionOutcome::TimedOut || outcome == ExecutionOutcome::CompileTimedOut;
    }

    /// Whether the run step was attempted at all
    bool reached_run_step() const {
        switch (outcome) {
        case ExecutionOutcome::CompileFailed:
        case ExecutionOutcome::CompileTimedOut:
        case ExecutionOutcome::CompilerNotFound:
        case ExecutionOutcome::CompilerCannotExecute:
            return false;
        default:
            return true;
        }
    }

    bool operator==(const ExecutionResult&) const = default;
};

} // namespace exegrader

template <>
struct fmt::formatter<::exegrader::ExecutionResult> : ::exegrader::DebugFormatter
{
    auto format(const ::exegrader::ExecutionResult& from, fmt::format_context& ctx) const {
        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "ExecutionResult{{outcome={}, exit_code={}, duration={:.3f}s, stdout={:?}, stderr={:?}}}",
                                  from.outcome, from.exit_code, from.duration_seconds, from.stdout_data,
                                  from.stderr_data);
        }

        return fmt::format_to(ctx.out(), "{} (exit code {}, {:.3f}s)", from.outcome, from.exit_code,
                              from.duration_seconds);
    }
};
