#pragma once

#include <exegrader/common/expected.hpp>
#include <exegrader/logging.hpp>

#include <libassert/assert.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

/// Thin wrappers over the syscalls used by the engine.
/// Each returns success/failure as an Expected, and logs failure at debug level.
/// None of these may be used in a forked child before exec (they log, and logging allocates).
namespace exegrader::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// Returns the number of bytes written, which may be less than `data.size()`
inline Expected<std::size_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err.message());
        return err;
    }

    return static_cast<std::size_t>(res);
}

/// reads from a file descriptor into `buffer`. See read(2)
/// Returns the number of bytes read; 0 signals end-of-file
inline Expected<std::size_t> read(int fd, std::span<char> buffer) {
    ssize_t res = ::read(fd, buffer.data(), buffer.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        // EAGAIN is routine for non-blocking pipes; do not spam the log
        if (err != std::errc::resource_unavailable_try_again) {
            LOG_DEBUG("read failed: '{}'", err.message());
        }
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");

    return static_cast<std::size_t>(res);
}

/// closes a file descriptor. See close(2)
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see kill(2)
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill({}, {}) failed: '{}'", pid, sig, err.message());
        return err;
    }

    return {};
}

/// Sends `sig` to every process in the process group `pgid`. See killpg(3)
/// ESRCH (the group is already empty) is not logged, as it is an expected outcome.
inline Expected<> killpg(pid_t pgid, int sig) {
    int res = ::killpg(pgid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        if (err != std::errc::no_such_process) {
            LOG_DEBUG("killpg({}, {}) failed: '{}'", pgid, sig, err.message());
        }
        return err;
    }

    return {};
}

/// see setpgid(2)
inline Expected<> setpgid(pid_t pid, pid_t pgid) {
    int res = ::setpgid(pid, pgid);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setpgid({}, {}) failed: '{}'", pid, pgid, err.message());
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see fcntl(2)
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());

        return err;
    }

    return res;
}

/// Adds O_NONBLOCK to the status flags of `fd`
inline Expected<> set_nonblocking(int fd) {
    auto flags = fcntl(fd, F_GETFL);
    if (!flags) {
        return flags.error();
    }

    auto res = fcntl(fd, F_SETFL, flags.value() | O_NONBLOCK); // NOLINT(hicpp-signed-bitwise)
    if (!res) {
        return res.error();
    }

    return {};
}

struct WaitStatus
{
    pid_t pid; // 0 if WNOHANG was given and the child has not changed state
    int status;
};

/// see waitpid(2)
/// EINTR is retried transparently
inline Expected<WaitStatus> waitpid(pid_t pid, int options = 0) {
    int status = 0;
    pid_t res = -1;

    do {
        res = ::waitpid(pid, &status, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitpid({}) failed: '{}'", pid, err.message());

        return err;
    }

    return WaitStatus{.pid = res, .status = status};
}

/// see waitid(2)
/// With WNOHANG, the returned `si_pid` is 0 if no child has changed state. EINTR is retried transparently
inline Expected<siginfo_t> waitid(idtype_t idtype, id_t id, int options) {
    siginfo_t info{};
    int res = -1;

    do {
        res = ::waitid(idtype, id, &info, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitid({}) failed: '{}'", id, err.message());

        return err;
    }

    return info;
}

/// see poll(2)
/// Returns the number of ready descriptors; EINTR is reported as 0 ready descriptors
inline Expected<int> poll(std::span<pollfd> fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        if (errno == EINTR) {
            return 0;
        }

        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err.message());

        return err;
    }

    return res;
}

struct Pipe
{
    int read_fd = -1;
    int write_fd = -1;
};

// Ensure that fds are packed so that pipe2 works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
inline Expected<Pipe> pipe2(int flags = O_CLOEXEC) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe2 failed: '{}'", err.message());

        return err;
    }

    return pipe;
}

/// Creates a uniquely named directory from `path_template`, which must end in "XXXXXX". See mkdtemp(3)
/// Returns the name of the created directory
inline Expected<std::string> mkdtemp(std::string path_template) {
    char* res = ::mkdtemp(path_template.data());

    if (res == nullptr) {
        auto err = make_error_code(errno);

        LOG_DEBUG("mkdtemp({:?}) failed: '{}'", path_template, err.message());

        return err;
    }

    return path_template;
}

using SignalHandlerT = void (*)(int);

/// see signal(2)
inline Expected<SignalHandlerT> signal(int sig, SignalHandlerT handler) {
    SignalHandlerT prev_handler = ::signal(sig, handler);

    if (prev_handler == SIG_ERR) {
        auto err = make_error_code();

        LOG_DEBUG("signal failed: '{}'", err.message());

        return err;
    }

    return prev_handler;
}

} // namespace exegrader::linux
