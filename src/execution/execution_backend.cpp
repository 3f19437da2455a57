#include <exegrader/execution/execution_backend.hpp>

#include "common/strings.hpp"

#include <exegrader/common/error_types.hpp>
#include <exegrader/exceptions.hpp>
#include <exegrader/execution/command_builder.hpp>
#include <exegrader/execution/execution_result.hpp>
#include <exegrader/execution/workspace.hpp>
#include <exegrader/language/language_profile.hpp>
#include <exegrader/language/language_registry.hpp>
#include <exegrader/logging.hpp>
#include <exegrader/subprocess/run_result.hpp>
#include <exegrader/subprocess/subprocess.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace exegrader {

namespace {

/// Outcome of one launched step (compile or run)
struct StepResult
{
    /// Absent if the command could not be launched; `launch_error` then says why
    std::optional<RunResult> run_result;
    ErrorKind launch_error{ErrorKind::UnknownError};

    std::string stdout_data;
    std::string stderr_data;
    std::chrono::duration<double> elapsed{};
};

/// Launches `args` in `cwd` and waits for it under `timeout`.
/// Captured output has its line endings normalized to '\n'.
/// Launch failures of the command are data; failures of the engine throw ExecutionError.
StepResult run_step(std::vector<std::string> args, const std::filesystem::path& cwd,
                    const std::optional<std::string>& stdin_data, std::chrono::seconds timeout) {
    const auto start_time = std::chrono::steady_clock::now();

    Subprocess proc{std::move(args), cwd};

    if (auto started = proc.start(stdin_data); !started) {
        switch (started.error()) {
        case ErrorKind::CommandNotFound:
        case ErrorKind::CannotExecute:
            return StepResult{.run_result = std::nullopt,
                              .launch_error = started.error(),
                              .stdout_data = {},
                              .stderr_data = {},
                              .elapsed = std::chrono::steady_clock::now() - start_time};
        default:
            throw ExecutionError{ErrorKind::SyscallFailure,
                                 fmt::format("Failed to launch {:?}: {}", proc.get_args().front(), started.error())};
        }
    }

    auto run_res = proc.run(timeout);

    if (!run_res) {
        throw ExecutionError{ErrorKind::SyscallFailure, fmt::format("Failed while running {:?}: {}",
                                                                    proc.get_args().front(), run_res.error())};
    }

    return StepResult{.run_result = run_res.value(),
                      .launch_error = ErrorKind::UnknownError,
                      .stdout_data = normalize_newlines(proc.get_stdout()),
                      .stderr_data = normalize_newlines(proc.get_stderr()),
                      .elapsed = proc.get_elapsed()};
}

enum class Step { Compile, Run };

/// Result for a command that could not be launched. The outcome records which step it was.
ExecutionResult launch_failure(const StepResult& step_result, Step step, std::string_view command,
                               double duration_seconds) {
    const bool compiling = step == Step::Compile;

    if (step_result.launch_error == ErrorKind::CommandNotFound) {
        return {.stdout_data = "",
                .stderr_data = fmt::format("Command not found: {}", command),
                .exit_code = EXIT_COMMAND_NOT_FOUND,
                .duration_seconds = duration_seconds,
                .outcome = compiling ? ExecutionOutcome::CompilerNotFound : ExecutionOutcome::CommandNotFound};
    }

    return {.stdout_data = "",
            .stderr_data = fmt::format("Cannot execute: {}", command),
            .exit_code = EXIT_CANNOT_EXECUTE,
            .duration_seconds = duration_seconds,
            .outcome = compiling ? ExecutionOutcome::CompilerCannotExecute : ExecutionOutcome::CannotExecute};
}

} // namespace

ExecutionBackend::ExecutionBackend(const LanguageRegistry& registry)
    : registry_{&registry} {}

ExecutionResult ExecutionBackend::execute(const ExecutionRequest& request) const {
    return execute(request.language, request.source_code, request.stdin_data, request.timeout);
}

ExecutionResult ExecutionBackend::execute(std::string_view language, std::string_view source_code,
                                          const std::optional<std::string>& stdin_data,
                                          std::optional<std::chrono::seconds> timeout) const {
    // Resolved before anything touches the filesystem
    const LanguageProfile& profile = registry_->get(language);

    return execute(profile, source_code, stdin_data, timeout);
}

ExecutionResult ExecutionBackend::execute(const LanguageProfile& profile, std::string_view source_code,
                                          const std::optional<std::string>& stdin_data,
                                          std::optional<std::chrono::seconds> timeout) const {
    const std::chrono::seconds effective_timeout = timeout.value_or(profile.timeout);
    ASSERT(effective_timeout > std::chrono::seconds::zero(), "Timeouts must be positive");

    auto workspace_res = Workspace::create();
    if (!workspace_res) {
        throw ExecutionError{workspace_res.error(), "Could not create a workspace"};
    }
    // Removed on every exit path from here on, including exceptions
    const Workspace workspace = std::move(workspace_res).value();

    const std::string source_name = fmt::format("{}{}", SOURCE_STEM, profile.source_extension);

    if (auto written = workspace.write_file(source_name, source_code); !written) {
        throw ExecutionError{written.error(), fmt::format("Could not write {}", workspace.file(source_name))};
    }

    const CommandPaths paths{.source = workspace.file(source_name), .binary = workspace.file(BINARY_NAME)};

    if (profile.compile_command) {
        std::vector<std::string> compile_args = build_command(*profile.compile_command, paths);
        const std::string compiler = compile_args.front();

        LOG_DEBUG("Compiling {} submission with {}", profile.id, compile_args);

        StepResult compiled = run_step(std::move(compile_args), workspace.get_path(), std::nullopt, effective_timeout);

        if (!compiled.run_result) {
            return launch_failure(compiled, Step::Compile, compiler, 0.0);
        }

        if (compiled.run_result->get_kind() == RunResult::Kind::TimedOut) {
            LOG_WARN("Compilation of {} submission timed out after {}", profile.id, effective_timeout);

            return {.stdout_data = std::move(compiled.stdout_data),
                    .stderr_data = std::move(compiled.stderr_data) + COMPILATION_TIMED_OUT_MARKER,
                    .exit_code = EXIT_TIMED_OUT,
                    .duration_seconds = 0.0,
                    .outcome = ExecutionOutcome::CompileTimedOut};
        }

        if (const int exit_code = compiled.run_result->to_exit_code(); exit_code != 0) {
            LOG_DEBUG("Compilation of {} submission failed with exit code {}", profile.id, exit_code);

            return {.stdout_data = std::move(compiled.stdout_data),
                    .stderr_data = std::move(compiled.stderr_data),
                    .exit_code = exit_code,
                    .duration_seconds = 0.0,
                    .outcome = ExecutionOutcome::CompileFailed};
        }
    }

    std::vector<std::string> run_args = build_command(profile.run_command, paths);
    const std::string program = run_args.front();

    LOG_DEBUG("Running {} submission with {}", profile.id, run_args);

    StepResult ran = run_step(std::move(run_args), workspace.get_path(), stdin_data, effective_timeout);

    if (!ran.run_result) {
        return launch_failure(ran, Step::Run, program, ran.elapsed.count());
    }

    if (ran.run_result->get_kind() == RunResult::Kind::TimedOut) {
        return {.stdout_data = std::move(ran.stdout_data),
                .stderr_data = std::move(ran.stderr_data) + EXECUTION_TIMED_OUT_MARKER,
                .exit_code = EXIT_TIMED_OUT,
                .duration_seconds = ran.elapsed.count(),
                .outcome = ExecutionOutcome::TimedOut};
    }

    return {.stdout_data = std::move(ran.stdout_data),
            .stderr_data = std::move(ran.stderr_data),
            .exit_code = ran.run_result->to_exit_code(),
            .duration_seconds = ran.elapsed.count(),
            .outcome = ExecutionOutcome::Completed};
}

} // namespace exegrader
