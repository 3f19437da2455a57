#include "catch2_custom.hpp"

#include <exegrader/exceptions.hpp>
#include <exegrader/execution/execution_backend.hpp>
#include <exegrader/execution/execution_result.hpp>
#include <exegrader/language/language_registry.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace std::chrono_literals;
using namespace std::string_literals;
using exegrader::ExecutionBackend;
using exegrader::ExecutionOutcome;
using exegrader::ExecutionRequest;
using exegrader::ExecutionResult;
using exegrader::LanguageProfile;
using exegrader::LanguageRegistry;

namespace fs = std::filesystem;

namespace {

/// Workspaces currently present in the temporary directory
std::vector<std::string> list_workspaces() {
    std::vector<std::string> found;
    for (const auto& entry : fs::directory_iterator{fs::temp_directory_path()}) {
        std::string name = entry.path().filename().string();
        if (name.starts_with(exegrader::Workspace::DEFAULT_PREFIX) && !name.starts_with("exegrader-test-")) {
            found.push_back(std::move(name));
        }
    }
    std::ranges::sort(found);
    return found;
}

} // namespace

TEST_CASE("Interpreted programs") {
    const auto registry = shell_registry();
    const ExecutionBackend backend{registry};

    SECTION("Output and exit code") {
        const auto res = backend.execute("sh", "echo hello; echo err >&2; exit 0");

        REQUIRE(res.stdout_data == "hello\n");
        REQUIRE(res.stderr_data == "err\n");
        REQUIRE(res.exit_code == 0);
        REQUIRE(res.outcome == ExecutionOutcome::Completed);
        REQUIRE(res.succeeded());
        REQUIRE(res.duration_seconds > 0.0);
    }

    SECTION("Output is never trimmed") {
        const auto res = backend.execute("sh", "printf '  padded \\n\\n'");

        REQUIRE(res.stdout_data == "  padded \n\n");
    }

    SECTION("Line endings are normalized") {
        const auto res = backend.execute("sh", R"(printf 'a\r\nb\rc\r\n'; printf 'e\r\n\r\n' >&2)");

        REQUIRE(res.stdout_data == "a\nb\nc\n");
        REQUIRE(res.stderr_data == "e\n\n");
    }

    SECTION("Runtime failure") {
        const auto res = backend.execute("sh", "echo before; exit 3");

        REQUIRE(res.stdout_data == "before\n");
        REQUIRE(res.exit_code == 3);
        REQUIRE(res.outcome == ExecutionOutcome::Completed);
        REQUIRE_FALSE(res.succeeded());
    }

    SECTION("Death by signal") {
        const auto res = backend.execute("sh", "kill -SEGV $$");

        REQUIRE(res.exit_code == -11);
        REQUIRE(res.outcome == ExecutionOutcome::Completed);
    }

    SECTION("stdin") {
        const auto res = backend.execute("sh", "read a; read b; echo $((a + b))", "2\n40\n"s);

        REQUIRE(res.stdout_data == "42\n");
    }

    SECTION("Absent stdin reads as EOF") {
        const auto res = backend.execute("sh", "if read line; then echo got; else echo eof; fi");

        REQUIRE(res.stdout_data == "eof\n");
    }

    SECTION("Language ids are case-insensitive") {
        REQUIRE(backend.execute("SH", "exit 0").succeeded());
    }

    SECTION("Requests") {
        const ExecutionRequest request{.language = "sh", .source_code = "cat", .stdin_data = "abc", .timeout = 2s};
        const auto res = backend.execute(request);

        REQUIRE(res.stdout_data == "abc");
        REQUIRE(res.exit_code == 0);
    }
}

TEST_CASE("The source is written verbatim as Main<ext> in a fresh working directory") {
    const auto registry = shell_registry();
    const ExecutionBackend backend{registry};

    const auto res = backend.execute("sh", "ls; pwd -P; cat Main.sh");

    const std::string first_line = res.stdout_data.substr(0, res.stdout_data.find('\n'));
    REQUIRE(first_line == "Main.sh");
    REQUIRE_THAT(res.stdout_data, Catch::Matchers::ContainsSubstring("ls; pwd -P; cat Main.sh"));
    REQUIRE_THAT(res.stdout_data, Catch::Matchers::ContainsSubstring("/exegrader-"));
}

TEST_CASE("Unsupported languages are rejected before anything runs") {
    const auto registry = shell_registry();
    const ExecutionBackend backend{registry};

    const auto before = list_workspaces();

    REQUIRE_THROWS_AS(backend.execute("cobol", "DISPLAY 'HI'."), exegrader::UnsupportedLanguageError);

    REQUIRE(list_workspaces() == before);
}

TEST_CASE("Compiled programs") {
    const auto registry = shell_registry();
    const ExecutionBackend backend{registry};

    SECTION("Compile then run") {
        const auto res = backend.execute("shc", "echo compiled; exit 5");

        REQUIRE(res.stdout_data == "compiled\n");
        REQUIRE(res.exit_code == 5);
        REQUIRE(res.outcome == ExecutionOutcome::Completed);
    }

    SECTION("The run step is skipped after a compile failure") {
        auto scratch = make_scratch_dir();
        const fs::path marker = scratch.file("ran");

        const LanguageRegistry failing{{LanguageProfile{
            .id = "failing",
            .source_extension = ".x",
            .compile_command = std::vector<std::string>{"sh", "-c", "echo 'syntax error' >&2; echo out; exit 1"},
            .run_command = {"touch", marker.string()},
            .timeout = 5s,
        }}};

        const auto res = ExecutionBackend{failing}.execute("failing", "whatever");

        REQUIRE(res.exit_code == 1);
        REQUIRE(res.stderr_data == "syntax error\n");
        REQUIRE(res.stdout_data == "out\n");
        REQUIRE(res.duration_seconds == 0.0);
        REQUIRE(res.outcome == ExecutionOutcome::CompileFailed);
        REQUIRE_FALSE(res.reached_run_step());
        REQUIRE_FALSE(fs::exists(marker));
    }

    SECTION("Missing compiler") {
        const auto res = backend.execute("broken", "echo never");

        REQUIRE(res.stdout_data.empty());
        REQUIRE(res.stderr_data == "Command not found: exegrader-no-such-compiler");
        REQUIRE(res.exit_code == 127);
        REQUIRE(res.duration_seconds == 0.0);
        REQUIRE(res.outcome == ExecutionOutcome::CompilerNotFound);
        REQUIRE_FALSE(res.reached_run_step());
    }
}

TEST_CASE("Missing interpreter") {
    const LanguageRegistry registry{{LanguageProfile{
        .id = "ghost",
        .source_extension = ".g",
        .compile_command = std::nullopt,
        .run_command = {"exegrader-no-such-interpreter", "{source}"},
        .timeout = 5s,
    }}};

    const auto res = ExecutionBackend{registry}.execute("ghost", "");

    REQUIRE(res.stdout_data.empty());
    REQUIRE(res.stderr_data == "Command not found: exegrader-no-such-interpreter");
    REQUIRE(res.exit_code == exegrader::EXIT_COMMAND_NOT_FOUND);
    REQUIRE(res.outcome == ExecutionOutcome::CommandNotFound);
    REQUIRE(res.reached_run_step());
}

TEST_CASE("Timeouts") {
    const auto registry = shell_registry(1s);
    const ExecutionBackend backend{registry};

    SECTION("Run step") {
        const auto res = backend.execute("sh", "echo started; echo warn >&2; sleep 30");

        REQUIRE(res.exit_code == -1);
        REQUIRE(res.outcome == ExecutionOutcome::TimedOut);
        REQUIRE(res.timed_out());
        REQUIRE(res.stdout_data == "started\n");
        REQUIRE(res.stderr_data == "warn\n\nExecution timed out.");
        REQUIRE(res.duration_seconds >= 1.0);
        REQUIRE(res.duration_seconds < 5.0);
    }

    SECTION("Caller override") {
        const auto res = backend.execute("sh", "sleep 2; echo finished", std::nullopt, 4s);

        REQUIRE(res.exit_code == 0);
        REQUIRE(res.stdout_data == "finished\n");
    }

    SECTION("Compile step") {
        const LanguageRegistry slow{{LanguageProfile{
            .id = "slow",
            .source_extension = ".s",
            .compile_command = std::vector<std::string>{"sleep", "30"},
            .run_command = {"true"},
            .timeout = 1s,
        }}};

        const auto res = ExecutionBackend{slow}.execute("slow", "");

        REQUIRE(res.exit_code == -1);
        REQUIRE(res.outcome == ExecutionOutcome::CompileTimedOut);
        REQUIRE(res.stderr_data.ends_with(exegrader::COMPILATION_TIMED_OUT_MARKER));
        REQUIRE(res.duration_seconds == 0.0);
    }
}

TEST_CASE("Workspaces do not outlive an execution") {
    const auto registry = shell_registry(1s);
    const ExecutionBackend backend{registry};

    const auto before = list_workspaces();

    std::ignore = backend.execute("sh", "echo ok");
    std::ignore = backend.execute("sh", "sleep 30");
    std::ignore = backend.execute("shc", "exit 2");
    std::ignore = backend.execute("broken", "");

    REQUIRE(list_workspaces() == before);
}

TEST_CASE("Executions are independent and repeatable") {
    const auto registry = shell_registry();
    const ExecutionBackend backend{registry};

    // Leftovers of one execution must not be visible to the next
    const auto first = backend.execute("sh", "ls; touch leftover");
    const auto second = backend.execute("sh", "ls; touch leftover");

    REQUIRE(first.stdout_data == "Main.sh\n");
    REQUIRE(second.stdout_data == first.stdout_data);
    REQUIRE(second.exit_code == first.exit_code);
    REQUIRE(second.outcome == first.outcome);
}

TEST_CASE("Built-in languages") {
    const auto registry = LanguageRegistry::with_defaults();
    const ExecutionBackend backend{registry};

    SECTION("python") {
        SKIP_WITHOUT_PROGRAM("python3");

        const auto res = backend.execute("python", "import sys\nprint(int(input()) * 2)\nsys.exit(7)\n", "21\n"s);

        REQUIRE(res.stdout_data == "42\n");
        REQUIRE(res.exit_code == 7);
    }

    SECTION("c") {
        SKIP_WITHOUT_PROGRAM("gcc");

        const auto res = backend.execute("c", "#include <stdio.h>\nint main(void) { puts(\"hi from c\"); return 0; }\n");

        REQUIRE(res.stdout_data == "hi from c\n");
        REQUIRE(res.exit_code == 0);
    }

    SECTION("c compile error") {
        SKIP_WITHOUT_PROGRAM("gcc");

        const auto res = backend.execute("c", "int main(void) { return }\n");

        REQUIRE(res.exit_code != 0);
        REQUIRE(res.outcome == ExecutionOutcome::CompileFailed);
        REQUIRE_THAT(res.stderr_data, Catch::Matchers::ContainsSubstring("error"));
        REQUIRE(res.duration_seconds == 0.0);
    }

    SECTION("cpp") {
        SKIP_WITHOUT_PROGRAM("g++");

        const auto res = backend.execute("cpp", "#include <iostream>\nint main() { std::cout << 6 * 7; }\n");

        REQUIRE(res.stdout_data == "42");
        REQUIRE(res.exit_code == 0);
    }
}
