#include <exegrader/subprocess/subprocess.hpp>

#include <exegrader/common/error_types.hpp>
#include <exegrader/common/expected.hpp>
#include <exegrader/common/linux.hpp>
#include <exegrader/logging.hpp>
#include <exegrader/subprocess/run_result.hpp>

#include <fmt/ranges.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace exegrader {

namespace {

using namespace std::chrono_literals;

/// Upper bound for a single poll, so that the child's exit is noticed promptly
constexpr auto MAX_POLL_INTERVAL = 5ms;

/// How long output is still collected from the pipes after the child exited
constexpr auto DRAIN_GRACE_PERIOD = 100ms;

constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

/// Sent by the child over the close-on-exec error pipe if it could not exec.
/// EOF without any data means that exec succeeded.
struct ExecFailure
{
    enum Step : int { Setup, Exec } step;

    int err;
};

/// Everything the forked child needs, prepared before fork so that the child does not allocate
struct ChildSetup
{
    char* const* argv;
    const char* working_dir; // nullptr to inherit
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
    int exec_err_fd;
};

/// Runs in the forked child. Only async-signal-safe calls are allowed here.
[[noreturn]] void exec_child(const ChildSetup& setup) noexcept {
    auto fail = [&setup](ExecFailure::Step step) {
        ExecFailure failure{.step = step, .err = errno};
        // Nothing sensible can be done if reporting fails; the parent then sees a plain exit code
        std::ignore = ::write(setup.exec_err_fd, &failure, sizeof(failure));
        ::_exit(126); // NOLINT(*-magic-numbers)
    };

    if (::setpgid(0, 0) == -1) {
        fail(ExecFailure::Setup);
    }

    if (::dup2(setup.stdin_fd, STDIN_FILENO) == -1 || ::dup2(setup.stdout_fd, STDOUT_FILENO) == -1 ||
        ::dup2(setup.stderr_fd, STDERR_FILENO) == -1) {
        fail(ExecFailure::Setup);
    }

    if (setup.working_dir != nullptr && ::chdir(setup.working_dir) == -1) {
        fail(ExecFailure::Setup);
    }

    // Ignored signals stay ignored across exec; the child gets a pristine SIGPIPE disposition and mask
    struct sigaction default_action{};
    default_action.sa_handler = SIG_DFL;
    ::sigemptyset(&default_action.sa_mask);
    ::sigaction(SIGPIPE, &default_action, nullptr);

    sigset_t empty_mask{};
    ::sigemptyset(&empty_mask);
    ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

    ::execvp(setup.argv[0], setup.argv);

    fail(ExecFailure::Exec);
    std::unreachable();
}

/// A child closing its stdin early must produce EPIPE for us, not kill the whole grader
void ignore_sigpipe() {
    static std::once_flag flag;

    std::call_once(flag, [] {
        if (auto res = linux::signal(SIGPIPE, SIG_IGN); !res) {
            LOG_WARN("Could not ignore SIGPIPE: {}", res.error().message());
        }
    });
}

/// Blocks until the child either execs (EOF) or reports why it could not
Result<std::optional<ExecFailure>> read_exec_failure(int fd) {
    ExecFailure failure{};
    std::span<char> bytes{reinterpret_cast<char*>(&failure), sizeof(failure)}; // NOLINT(*-reinterpret-cast)
    std::size_t total = 0;

    while (total < bytes.size()) {
        auto res = linux::read(fd, bytes.subspan(total));

        if (!res) {
            if (res.error() == std::errc::interrupted) {
                continue;
            }
            return ErrorKind::SyscallFailure;
        }

        if (res.value() == 0) {
            break;
        }

        total += res.value();
    }

    if (total == 0) {
        return std::optional<ExecFailure>{};
    }

    if (total != sizeof(failure)) {
        LOG_WARN("Truncated exec failure report ({} bytes)", total);
        return ErrorKind::SyscallFailure;
    }

    return std::optional<ExecFailure>{failure};
}

RunResult to_run_result(int status) {
    if (WIFEXITED(status)) {
        return RunResult::make_exited(WEXITSTATUS(status));
    }

    if (WIFSIGNALED(status)) {
        return RunResult::make_killed(WTERMSIG(status));
    }

    UNREACHABLE("waitpid reported a state change other than termination", status);
}

} // namespace

Subprocess::Subprocess(std::vector<std::string> args, std::filesystem::path working_dir)
    : args_{std::move(args)}
    , working_dir_{std::move(working_dir)} {}

Subprocess::~Subprocess() {
    if (is_alive()) {
        if (auto res = kill(); !res) {
            LOG_WARN("Failed to kill subprocess {} on destruction: {}", child_pid_, res.error());
        }
    }

    close_pipes();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : args_{std::move(other.args_)}
    , working_dir_{std::move(other.working_dir_)}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , stdin_fd_{std::exchange(other.stdin_fd_, -1)}
    , stdout_fd_{std::exchange(other.stdout_fd_, -1)}
    , stderr_fd_{std::exchange(other.stderr_fd_, -1)}
    , stdin_data_{std::move(other.stdin_data_)}
    , stdin_cursor_{std::exchange(other.stdin_cursor_, 0)}
    , stdout_buffer_{std::move(other.stdout_buffer_)}
    , stderr_buffer_{std::move(other.stderr_buffer_)}
    , start_time_{other.start_time_}
    , elapsed_{other.elapsed_}
    , result_{std::exchange(other.result_, std::nullopt)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    if (is_alive()) {
        if (auto res = kill(); !res) {
            LOG_WARN("Failed to kill subprocess {} on move assignment: {}", child_pid_, res.error());
        }
    }
    close_pipes();

    args_ = std::move(rhs.args_);
    working_dir_ = std::move(rhs.working_dir_);
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    stdin_fd_ = std::exchange(rhs.stdin_fd_, -1);
    stdout_fd_ = std::exchange(rhs.stdout_fd_, -1);
    stderr_fd_ = std::exchange(rhs.stderr_fd_, -1);
    stdin_data_ = std::move(rhs.stdin_data_);
    stdin_cursor_ = std::exchange(rhs.stdin_cursor_, 0);
    stdout_buffer_ = std::move(rhs.stdout_buffer_);
    stderr_buffer_ = std::move(rhs.stderr_buffer_);
    start_time_ = rhs.start_time_;
    elapsed_ = rhs.elapsed_;
    result_ = std::exchange(rhs.result_, std::nullopt);

    return *this;
}

Result<void> Subprocess::start(std::optional<std::string> stdin_data) {
    ASSERT(!args_.empty(), "A subprocess needs at least a program name");
    ASSERT(child_pid_ == 0, "Subprocess was already started", child_pid_);

    ignore_sigpipe();

    std::vector<char*> argv;
    argv.reserve(args_.size() + 1);
    for (std::string& arg : args_) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    linux::Pipe stdin_pipe;
    linux::Pipe stdout_pipe;
    linux::Pipe stderr_pipe;
    linux::Pipe exec_err_pipe;

    // The parent's pipe ends are owned by members (and closed by close_pipes); everything else is closed here
    auto close_locals = gsl::finally([&] {
        for (int* fd : {&stdin_pipe.read_fd, &stdout_pipe.write_fd, &stderr_pipe.write_fd, &exec_err_pipe.read_fd,
                        &exec_err_pipe.write_fd}) {
            close_fd(*fd);
        }
    });

    stdin_pipe = TRYE(linux::pipe2(), SyscallFailure);
    stdin_fd_ = stdin_pipe.write_fd;
    stdout_pipe = TRYE(linux::pipe2(), SyscallFailure);
    stdout_fd_ = stdout_pipe.read_fd;
    stderr_pipe = TRYE(linux::pipe2(), SyscallFailure);
    stderr_fd_ = stderr_pipe.read_fd;
    exec_err_pipe = TRYE(linux::pipe2(), SyscallFailure);

    const ChildSetup setup{
        .argv = argv.data(),
        .working_dir = working_dir_.empty() ? nullptr : working_dir_.c_str(),
        .stdin_fd = stdin_pipe.read_fd,
        .stdout_fd = stdout_pipe.write_fd,
        .stderr_fd = stderr_pipe.write_fd,
        .exec_err_fd = exec_err_pipe.write_fd,
    };

    LOG_DEBUG("Launching {} (cwd={})", args_, working_dir_);

    start_time_ = std::chrono::steady_clock::now();

    auto fork_res = linux::fork();
    if (!fork_res) {
        close_pipes();
        return ErrorKind::SyscallFailure;
    }

    if (fork_res->which == linux::Fork::Child) {
        exec_child(setup);
    }

    child_pid_ = fork_res->pid;

    // Our copies of the child's ends must be closed, or we would never see EOF on any pipe
    for (int* fd : {&stdin_pipe.read_fd, &stdout_pipe.write_fd, &stderr_pipe.write_fd, &exec_err_pipe.write_fd}) {
        close_fd(*fd);
    }

    auto exec_failure = read_exec_failure(exec_err_pipe.read_fd);

    if (!exec_failure || exec_failure->has_value()) {
        // The child has exited (or is about to); collect it so that no zombie remains
        if (auto res = linux::waitpid(child_pid_); !res) {
            LOG_WARN("Could not reap failed child {}: {}", child_pid_, res.error().message());
        }
        child_pid_ = 0;
        close_pipes();

        if (!exec_failure) {
            return exec_failure.error();
        }

        const ExecFailure failure = exec_failure->value();
        LOG_DEBUG("Could not execute {:?} ({}): {}", args_.front(),
                  failure.step == ExecFailure::Exec ? "exec" : "setup", std::strerror(failure.err));

        if (failure.step == ExecFailure::Exec && failure.err == ENOENT) {
            return ErrorKind::CommandNotFound;
        }
        return ErrorKind::CannotExecute;
    }

    return init_parent(std::move(stdin_data));
}

Result<void> Subprocess::init_parent(std::optional<std::string> stdin_data) {
    TRYE(linux::set_nonblocking(stdout_fd_), SyscallFailure);
    TRYE(linux::set_nonblocking(stderr_fd_), SyscallFailure);

    if (!stdin_data || stdin_data->empty()) {
        // No input: the child sees EOF on its first read
        close_fd(stdin_fd_);
        return {};
    }

    TRYE(linux::set_nonblocking(stdin_fd_), SyscallFailure);

    stdin_data_ = std::move(stdin_data).value();
    stdin_cursor_ = 0;

    return {};
}

Result<RunResult> Subprocess::run(std::chrono::milliseconds timeout) {
    using std::chrono::steady_clock;

    ASSERT(child_pid_ != 0, "run() requires a successfully started subprocess");

    if (result_) {
        return *result_;
    }

    const auto deadline = start_time_ + timeout;
    bool timed_out = false;

    // Feed stdin and drain output until the child exits; it is left as a zombie (WNOWAIT) so that its
    // process group id stays reserved until the stragglers are killed below
    while (true) {
        auto info = TRYE(linux::waitid(P_PID, gsl::narrow_cast<id_t>(child_pid_), WEXITED | WNOHANG | WNOWAIT),
                         SyscallFailure);

        if (info.si_pid == child_pid_) {
            break;
        }

        const auto now = steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }

        std::array<pollfd, 3> fds{};
        std::size_t num_fds = 0;

        if (stdin_fd_ != -1) {
            fds.at(num_fds++) = {.fd = stdin_fd_, .events = POLLOUT, .revents = 0};
        }
        if (stdout_fd_ != -1) {
            fds.at(num_fds++) = {.fd = stdout_fd_, .events = POLLIN, .revents = 0};
        }
        if (stderr_fd_ != -1) {
            fds.at(num_fds++) = {.fd = stderr_fd_, .events = POLLIN, .revents = 0};
        }

        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        const int poll_ms = gsl::narrow_cast<int>(std::min<std::chrono::milliseconds>(remaining, MAX_POLL_INTERVAL).count());

        TRYE(linux::poll(std::span{fds.data(), num_fds}, poll_ms), SyscallFailure);

        for (const pollfd& pfd : std::span{fds.data(), num_fds}) {
            if (pfd.revents == 0) {
                continue;
            }

            if (pfd.fd == stdin_fd_) {
                pump_stdin();
            } else if (pfd.fd == stdout_fd_) {
                drain(stdout_fd_, stdout_buffer_);
            } else if (pfd.fd == stderr_fd_) {
                drain(stderr_fd_, stderr_buffer_);
            }
        }
    }

    elapsed_ = steady_clock::now() - start_time_;
    close_fd(stdin_fd_);

    if (timed_out) {
        LOG_WARN("{:?} timed out after {}; killing process group {}", args_.front(), timeout, child_pid_);
    }

    // On timeout this kills the child itself; otherwise only leftover descendants in its group
    if (auto res = linux::killpg(child_pid_, SIGKILL); !res && res.error() != std::errc::no_such_process) {
        LOG_WARN("Could not kill process group {}: {}", child_pid_, res.error().message());
    }

    TRY(reap(timed_out));

    drain_remaining(DRAIN_GRACE_PERIOD);
    close_pipes();

    LOG_DEBUG("{:?} finished: {} after {}", args_.front(), *result_, elapsed_);

    return *result_;
}

Result<void> Subprocess::kill() {
    if (!is_alive()) {
        return {};
    }

    if (auto res = linux::killpg(child_pid_, SIGKILL); !res && res.error() != std::errc::no_such_process) {
        TRYE(linux::kill(child_pid_, SIGKILL), SyscallFailure);
    }

    TRY(reap(false));
    close_pipes();

    return {};
}

Result<void> Subprocess::reap(bool timed_out) {
    auto status = TRYE(linux::waitpid(child_pid_), SyscallFailure);

    if (timed_out) {
        result_ = RunResult::make_timed_out();
    } else {
        result_ = to_run_result(status.status);
    }

    return {};
}

void Subprocess::pump_stdin() {
    while (stdin_cursor_ < stdin_data_.size()) {
        auto res = linux::write(stdin_fd_, std::string_view{stdin_data_}.substr(stdin_cursor_));

        if (!res) {
            if (res.error() == std::errc::resource_unavailable_try_again || res.error() == std::errc::interrupted) {
                return;
            }

            // Typically EPIPE: the child closed its stdin; the rest of the input is discarded
            LOG_DEBUG("Stopped writing stdin after {} of {} bytes: {}", stdin_cursor_, stdin_data_.size(),
                      res.error().message());
            break;
        }

        stdin_cursor_ += res.value();
    }

    close_fd(stdin_fd_);
}

void Subprocess::drain(int& fd, std::string& buffer) {
    std::array<char, READ_CHUNK_SIZE> chunk{};

    while (fd != -1) {
        auto res = linux::read(fd, chunk);

        if (!res) {
            if (res.error() == std::errc::interrupted) {
                continue;
            }
            if (res.error() != std::errc::resource_unavailable_try_again) {
                LOG_WARN("Reading child output failed: {}", res.error().message());
                close_fd(fd);
            }
            return;
        }

        if (res.value() == 0) {
            close_fd(fd);
            return;
        }

        buffer.append(chunk.data(), res.value());
    }
}

void Subprocess::drain_remaining(std::chrono::milliseconds grace) {
    using std::chrono::steady_clock;

    const auto deadline = steady_clock::now() + grace;

    while (stdout_fd_ != -1 || stderr_fd_ != -1) {
        drain(stdout_fd_, stdout_buffer_);
        drain(stderr_fd_, stderr_buffer_);

        const auto now = steady_clock::now();
        if (now >= deadline || (stdout_fd_ == -1 && stderr_fd_ == -1)) {
            break;
        }

        // Only a descendant which escaped the process group can still hold the write ends open
        std::array<pollfd, 2> fds{{
            {.fd = stdout_fd_, .events = POLLIN, .revents = 0},
            {.fd = stderr_fd_, .events = POLLIN, .revents = 0},
        }};
        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);

        // poll ignores negative fds
        if (auto res = linux::poll(fds, gsl::narrow_cast<int>(remaining.count())); !res) {
            break;
        }
    }

    if (stdout_fd_ != -1 || stderr_fd_ != -1) {
        LOG_DEBUG("Output pipes of {:?} still open after {}; abandoning them", args_.front(), grace);
    }
}

void Subprocess::close_fd(int& fd) {
    if (fd == -1) {
        return;
    }

    if (auto res = linux::close(fd); !res) {
        LOG_WARN("Failed to close fd {}: {}", fd, res.error().message());
    }

    fd = -1;
}

void Subprocess::close_pipes() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

} // namespace exegrader
