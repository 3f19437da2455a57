#pragma once

#include <exegrader/common/class_traits.hpp>
#include <exegrader/common/error_types.hpp>
#include <exegrader/common/linux.hpp>
#include <exegrader/subprocess/run_result.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace exegrader {

/// A child process with piped stdin, stdout and stderr, running in its own process group.
///
/// Usage: construct, `start()`, then `run()` to drive the child to completion.
/// Output is captured as raw bytes and never trimmed or decoded.
class Subprocess : NonCopyable
{
public:
    /// `args[0]` is looked up in PATH when it contains no slash (see execvp(3))
    /// An empty `working_dir` means the child inherits the current working directory.
    explicit Subprocess(std::vector<std::string> args, std::filesystem::path working_dir = {});
    ~Subprocess();

    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& rhs) noexcept;

    /// Forks and execs the child. When `stdin_data` is absent, the child's stdin is at EOF immediately.
    ///
    /// Returns CommandNotFound if the executable does not exist, CannotExecute if exec failed for any
    /// other reason (e.g., permissions), and SyscallFailure if the process could not be set up.
    /// In all of these cases no child remains.
    Result<void> start(std::optional<std::string> stdin_data = std::nullopt);

    /// Feeds stdin and collects stdout/stderr until the child exits or `timeout` elapses (measured
    /// from `start`). On timeout the whole process group is killed and reaped before returning.
    Result<RunResult> run(std::chrono::milliseconds timeout);

    const std::string& get_stdout() const { return stdout_buffer_; }

    const std::string& get_stderr() const { return stderr_buffer_; }

    /// Wall-clock time from start until exit (or until the kill, on timeout)
    std::chrono::duration<double> get_elapsed() const { return elapsed_; }

    pid_t get_pid() const { return child_pid_; }

    const std::vector<std::string>& get_args() const { return args_; }

    /// Whether the child was started and has not been reaped yet
    bool is_alive() const { return child_pid_ != 0 && !result_.has_value(); }

    /// Kills the child's whole process group and reaps the child
    Result<void> kill();

private:
    /// Parent side of the setup, once the child has exec'd
    Result<void> init_parent(std::optional<std::string> stdin_data);

    /// Moves pending stdin data into the pipe, closing it once everything was written
    void pump_stdin();

    /// Reads everything currently available on `fd` into `buffer`. Closes (and resets) `fd` on EOF.
    void drain(int& fd, std::string& buffer);

    /// Keeps draining stdout/stderr after the child exited, until EOF on both or `grace` passes
    void drain_remaining(std::chrono::milliseconds grace);

    /// Blocks until the child can be reaped, and stores its RunResult
    Result<void> reap(bool timed_out);

    void close_fd(int& fd);
    void close_pipes();

    std::vector<std::string> args_;
    std::filesystem::path working_dir_;

    pid_t child_pid_{};

    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    std::string stdin_data_;
    std::size_t stdin_cursor_{};

    std::string stdout_buffer_;
    std::string stderr_buffer_;

    std::chrono::steady_clock::time_point start_time_;
    std::chrono::duration<double> elapsed_{};

    std::optional<RunResult> result_;
};

} // namespace exegrader
