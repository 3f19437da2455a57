#include "catch2_custom.hpp"

#include <exegrader/common/error_types.hpp>
#include <exegrader/execution/workspace.hpp>
#include <exegrader/subprocess/run_result.hpp>
#include <exegrader/subprocess/subprocess.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

using namespace std::chrono_literals;
using exegrader::ErrorKind;
using exegrader::RunResult;
using exegrader::Subprocess;

namespace {

Subprocess run_shell(const std::string& script, std::optional<std::string> stdin_data = std::nullopt,
                     std::chrono::milliseconds timeout = 5s) {
    Subprocess proc{{"sh", "-c", script}};
    REQUIRE(proc.start(std::move(stdin_data)));
    REQUIRE(proc.run(timeout));
    return proc;
}

/// Whether `pid` has terminated, waiting up to a second for it to do so.
/// A zombie that was reparented counts as terminated.
bool has_terminated(pid_t pid) {
    const std::filesystem::path stat_path = fmt::format("/proc/{}/stat", pid);

    for (int i = 0; i < 100; ++i) {
        std::ifstream stat_file{stat_path};
        if (!stat_file.is_open()) {
            return true;
        }

        std::string stat;
        std::getline(stat_file, stat);

        // Format: "pid (comm) state ..."
        const auto comm_end = stat.rfind(')');
        if (comm_end != std::string::npos && comm_end + 2 < stat.size() && stat[comm_end + 2] == 'Z') {
            return true;
        }

        std::this_thread::sleep_for(10ms);
    }

    return false;
}

} // namespace

TEST_CASE("RunResult conventions") {
    REQUIRE(RunResult::make_exited(0).to_exit_code() == 0);
    REQUIRE(RunResult::make_exited(42).to_exit_code() == 42);
    REQUIRE(RunResult::make_killed(SIGKILL).to_exit_code() == -SIGKILL);
    REQUIRE(RunResult::make_killed(SIGSEGV).get_kind() == RunResult::Kind::Killed);
    REQUIRE(RunResult::make_timed_out().to_exit_code() == -1);
    REQUIRE(RunResult::make_timed_out().get_kind() == RunResult::Kind::TimedOut);
    REQUIRE(RunResult::make_exited(1) != RunResult::make_killed(1));
}

TEST_CASE("stdout and stderr are captured separately and verbatim") {
    auto proc = run_shell(R"(printf 'line 1\n  line 2  '; printf 'oops\r\n' >&2)");

    REQUIRE(proc.get_stdout() == "line 1\n  line 2  ");
    REQUIRE(proc.get_stderr() == "oops\r\n");
}

TEST_CASE("Arguments are passed without a shell") {
    Subprocess proc{{"printf", "%s|", "two words", "$HOME", "*"}};
    REQUIRE(proc.start());
    REQUIRE(proc.run(5s));

    REQUIRE(proc.get_stdout() == "two words|$HOME|*|");
}

TEST_CASE("Exit codes") {
    SECTION("Success") {
        Subprocess proc{{"true"}};
        REQUIRE(proc.start());
        REQUIRE(proc.run(5s) == RunResult::make_exited(0));
    }

    SECTION("Failure") {
        Subprocess proc{{"sh", "-c", "exit 3"}};
        REQUIRE(proc.start());
        REQUIRE(proc.run(5s) == RunResult::make_exited(3));
    }

    SECTION("A program exiting with 127 itself is not a missing command") {
        Subprocess proc{{"sh", "-c", "exit 127"}};
        REQUIRE(proc.start());
        REQUIRE(proc.run(5s) == RunResult::make_exited(127));
    }

    SECTION("Death by signal") {
        Subprocess proc{{"sh", "-c", "kill -TERM $$"}};
        REQUIRE(proc.start());

        auto res = proc.run(5s);
        REQUIRE(res == RunResult::make_killed(SIGTERM));
        REQUIRE(res->to_exit_code() == -SIGTERM);
    }
}

TEST_CASE("stdin is fed to the child") {
    SECTION("Small input") {
        Subprocess proc{{"cat"}};
        REQUIRE(proc.start("hello\nworld"));
        REQUIRE(proc.run(5s) == RunResult::make_exited(0));
        REQUIRE(proc.get_stdout() == "hello\nworld");
    }

    SECTION("Absent input is immediate EOF") {
        Subprocess proc{{"cat"}};
        REQUIRE(proc.start());
        REQUIRE(proc.run(5s) == RunResult::make_exited(0));
        REQUIRE(proc.get_stdout().empty());
    }

    SECTION("Empty input is immediate EOF") {
        Subprocess proc{{"cat"}};
        REQUIRE(proc.start(""));
        REQUIRE(proc.run(5s) == RunResult::make_exited(0));
        REQUIRE(proc.get_stdout().empty());
    }

    SECTION("Input and output much larger than a pipe buffer") {
        std::string big_input;
        for (int i = 0; big_input.size() < 2 * 1024 * 1024; ++i) {
            big_input += fmt::format("{}\n", i);
        }

        Subprocess proc{{"cat"}};
        REQUIRE(proc.start(big_input));
        REQUIRE(proc.run(10s) == RunResult::make_exited(0));
        REQUIRE(proc.get_stdout().size() == big_input.size());
        REQUIRE(proc.get_stdout() == big_input);
    }

    SECTION("A child that never reads its input") {
        const std::string big_input(1024 * 1024, 'x');

        Subprocess proc{{"sh", "-c", "echo done"}};
        REQUIRE(proc.start(big_input));
        REQUIRE(proc.run(5s) == RunResult::make_exited(0));
        REQUIRE(proc.get_stdout() == "done\n");
    }
}

TEST_CASE("The working directory is honored") {
    auto scratch = make_scratch_dir();

    Subprocess proc{{"pwd", "-P"}, scratch.get_path()};
    REQUIRE(proc.start());
    REQUIRE(proc.run(5s));

    REQUIRE(std::filesystem::equivalent(proc.get_stdout().substr(0, proc.get_stdout().size() - 1), scratch.get_path()));
}

TEST_CASE("Launch failures are reported exactly") {
    SECTION("Missing executable") {
        Subprocess proc{{"exegrader-definitely-not-a-command"}};
        auto res = proc.start();

        REQUIRE(res == ErrorKind::CommandNotFound);
        REQUIRE_FALSE(proc.is_alive());
    }

    SECTION("Missing executable given by path") {
        Subprocess proc{{"/nonexistent/dir/program"}};
        REQUIRE(proc.start() == ErrorKind::CommandNotFound);
    }

    SECTION("File without execute permission") {
        auto scratch = make_scratch_dir();
        REQUIRE(scratch.write_file("script.sh", "#!/bin/sh\necho hi\n"));

        Subprocess proc{{scratch.file("script.sh").string()}};
        REQUIRE(proc.start() == ErrorKind::CannotExecute);
        REQUIRE_FALSE(proc.is_alive());
    }

    SECTION("Missing working directory") {
        Subprocess proc{{"true"}, "/nonexistent/dir"};
        REQUIRE(proc.start() == ErrorKind::CannotExecute);
    }
}

TEST_CASE("Timeouts kill the process") {
    Subprocess proc{{"sleep", "30"}};
    REQUIRE(proc.start());
    const pid_t pid = proc.get_pid();

    const auto before = std::chrono::steady_clock::now();
    auto res = proc.run(300ms);
    const std::chrono::duration<double> took = std::chrono::steady_clock::now() - before;

    REQUIRE(res == RunResult::make_timed_out());
    REQUIRE(res->to_exit_code() == -1);
    REQUIRE(took.count() < 3.0);
    REQUIRE(proc.get_elapsed().count() >= 0.3);
    REQUIRE_FALSE(proc.is_alive());
    REQUIRE(has_terminated(pid));
}

TEST_CASE("Output written before a timeout is kept") {
    Subprocess proc{{"sh", "-c", "echo partial; sleep 30"}};
    REQUIRE(proc.start());

    REQUIRE(proc.run(500ms) == RunResult::make_timed_out());
    REQUIRE(proc.get_stdout() == "partial\n");
}

TEST_CASE("The whole process group is killed") {
    SECTION("On timeout") {
        // The background sleep would otherwise outlive the shell
        Subprocess proc{{"sh", "-c", "sleep 30 & echo $!; wait"}};
        REQUIRE(proc.start());

        REQUIRE(proc.run(500ms) == RunResult::make_timed_out());

        const pid_t grandchild = std::stoi(proc.get_stdout());
        REQUIRE(has_terminated(grandchild));
    }

    SECTION("After a normal exit") {
        Subprocess proc{{"sh", "-c", "sleep 30 & echo $!"}};
        REQUIRE(proc.start());

        const auto before = std::chrono::steady_clock::now();
        REQUIRE(proc.run(10s) == RunResult::make_exited(0));
        const std::chrono::duration<double> took = std::chrono::steady_clock::now() - before;
        REQUIRE(took.count() < 5.0);

        const pid_t grandchild = std::stoi(proc.get_stdout());
        REQUIRE(has_terminated(grandchild));
    }
}

TEST_CASE("Running again returns the same result") {
    Subprocess proc{{"sh", "-c", "echo once; exit 4"}};
    REQUIRE(proc.start());
    REQUIRE(proc.is_alive());

    REQUIRE(proc.run(5s) == RunResult::make_exited(4));
    REQUIRE_FALSE(proc.is_alive());
    REQUIRE(proc.run(5s) == RunResult::make_exited(4));
    REQUIRE(proc.get_stdout() == "once\n");
}

TEST_CASE("Destroying a running subprocess kills it") {
    pid_t pid = 0;

    {
        Subprocess proc{{"sleep", "30"}};
        REQUIRE(proc.start());
        pid = proc.get_pid();
        REQUIRE(proc.is_alive());
    }

    REQUIRE(has_terminated(pid));
}

TEST_CASE("Explicit kill") {
    Subprocess proc{{"sleep", "30"}};
    REQUIRE(proc.start());

    REQUIRE(proc.kill());
    REQUIRE_FALSE(proc.is_alive());
    REQUIRE(proc.run(5s) == RunResult::make_killed(SIGKILL));
}
