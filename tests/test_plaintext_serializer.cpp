#include "catch2_custom.hpp"

#include "output/plaintext_serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <exegrader/execution/execution_result.hpp>
#include <exegrader/grading/test_case.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

using exegrader::ExecutionOutcome;
using exegrader::ExecutionResult;
using exegrader::GradingVerdict;
using exegrader::PlainTextSerializer;
using exegrader::TestCaseResult;
using exegrader::VerbosityLevel;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::Equals;

namespace {

class StringSink : public exegrader::Sink
{
public:
    void write(std::string_view str) override { buffer += str; }

    void flush() override { ++num_flushes; }

    std::string buffer;
    int num_flushes = 0;
};

PlainTextSerializer make_serializer(StringSink& sink, VerbosityLevel verbosity) {
    return PlainTextSerializer{sink, exegrader::ProgramOptions::ColorizeOpt::Never, verbosity};
}

TestCaseResult failed_result(bool hidden) {
    return TestCaseResult{.test_id = 2,
                          .passed = false,
                          .stdout_data = "41\n",
                          .stderr_data = "",
                          .expected_output = "42\n",
                          .input_data = "40 2\n",
                          .exit_code = 0,
                          .duration_seconds = 0.01,
                          .is_hidden = hidden};
}

TestCaseResult passed_result(int id) {
    return TestCaseResult{.test_id = id,
                          .passed = true,
                          .stdout_data = "ok\n",
                          .stderr_data = "",
                          .expected_output = "ok",
                          .input_data = std::nullopt,
                          .exit_code = 0,
                          .duration_seconds = 0.01,
                          .is_hidden = false};
}

} // namespace

TEST_CASE("Failed tests show their evidence") {
    StringSink sink;
    auto serializer = make_serializer(sink, VerbosityLevel::Summary);

    serializer.on_test_result(failed_result(false));

    REQUIRE_THAT(sink.buffer, ContainsSubstring("Test 2    : FAILED (exit code 0, 0.010s)"));
    REQUIRE_THAT(sink.buffer, ContainsSubstring("  input:\n    | 40 2\n"));
    REQUIRE_THAT(sink.buffer, ContainsSubstring("  expected output:\n    | 42\n"));
    REQUIRE_THAT(sink.buffer, ContainsSubstring("  actual output:\n    | 41\n"));
    REQUIRE_THAT(sink.buffer, !ContainsSubstring("stderr"));
}

TEST_CASE("Hidden tests are redacted") {
    StringSink sink;
    auto serializer = make_serializer(sink, VerbosityLevel::Extra);

    serializer.on_test_result(failed_result(true));

    REQUIRE_THAT(sink.buffer, ContainsSubstring("  input:\n    | <hidden>\n"));
    REQUIRE_THAT(sink.buffer, ContainsSubstring("  expected output:\n    | <hidden>\n"));
    REQUIRE_THAT(sink.buffer, !ContainsSubstring("40 2"));
    REQUIRE_THAT(sink.buffer, !ContainsSubstring("42"));

    // The student's own output is still shown
    REQUIRE_THAT(sink.buffer, ContainsSubstring("    | 41\n"));
}

TEST_CASE("Passing tests are only listed at higher verbosity") {
    StringSink sink;

    SECTION("Summary") {
        auto serializer = make_serializer(sink, VerbosityLevel::Summary);
        serializer.on_test_result(passed_result(1));
        REQUIRE(sink.buffer.empty());
    }

    SECTION("All") {
        auto serializer = make_serializer(sink, VerbosityLevel::All);
        serializer.on_test_result(passed_result(1));
        REQUIRE_THAT(sink.buffer, Equals("Test 1    : PASSED (exit code 0, 0.010s)\n"));
    }
}

TEST_CASE("Verdict summaries") {
    StringSink sink;
    auto serializer = make_serializer(sink, VerbosityLevel::Summary);

    serializer.on_submission_begin({.path = "alice/sum.py", .language = "python", .exercise_id = "sum"});
    REQUIRE_THAT(sink.buffer, ContainsSubstring("Submission: alice/sum.py (python)\n"));
    REQUIRE_THAT(sink.buffer, ContainsSubstring("Exercise: sum\n"));

    SECTION("Everything passed") {
        serializer.on_verdict({.passed_all = true, .results = {passed_result(1), passed_result(2)}}, 2);
        REQUIRE_THAT(sink.buffer, ContainsSubstring("All tests passed (2 tests)\n"));
    }

    SECTION("Stopped early") {
        TestCaseResult crashed = failed_result(false);
        crashed.exit_code = -11;

        serializer.on_verdict({.passed_all = false, .results = {passed_result(1), crashed}}, 5);

        REQUIRE_THAT(sink.buffer, ContainsSubstring("5 total"));
        REQUIRE_THAT(sink.buffer, ContainsSubstring("1 passed"));
        REQUIRE_THAT(sink.buffer, ContainsSubstring("1 failed"));
        REQUIRE_THAT(sink.buffer, ContainsSubstring("Stopped after test 2; 3 tests not run\n"));
    }
}

TEST_CASE("Quiet output is one line per submission") {
    StringSink sink;
    auto serializer = make_serializer(sink, VerbosityLevel::Quiet);

    serializer.on_run_metadata({.version_string = "1.0.0", .start_time = {}});
    serializer.on_submission_begin({.path = "bob.sh", .language = "sh", .exercise_id = "sum"});
    serializer.on_test_begin({.id = 1, .input_data = std::nullopt, .expected_output = "", .timeout = std::nullopt});
    serializer.on_test_result(failed_result(false));
    serializer.on_verdict({.passed_all = false, .results = {passed_result(1), failed_result(false)}}, 3);

    REQUIRE_THAT(sink.buffer, Equals("bob.sh: FAILED (1/3 tests passed)\n"));
}

TEST_CASE("Batch totals are written when finalizing") {
    StringSink sink;
    auto serializer = make_serializer(sink, VerbosityLevel::Quiet);

    serializer.on_submission_begin({.path = "a.sh", .language = "sh", .exercise_id = "sum"});
    serializer.on_verdict({.passed_all = true, .results = {passed_result(1)}}, 1);
    serializer.on_submission_begin({.path = "b.sh", .language = "sh", .exercise_id = "sum"});
    serializer.on_error("Could not grade b.sh: Permission denied");
    serializer.on_submission_begin({.path = "c.sh", .language = "sh", .exercise_id = "sum"});
    serializer.on_verdict({.passed_all = false, .results = {failed_result(false)}}, 1);

    serializer.finalize();

    REQUIRE_THAT(sink.buffer, ContainsSubstring("a.sh: PASSED (1/1 test passed)\n"));
    REQUIRE_THAT(sink.buffer, ContainsSubstring("Could not grade b.sh: Permission denied\n"));
    REQUIRE_THAT(sink.buffer, ContainsSubstring("c.sh: FAILED (0/1 test passed)\n"));
    REQUIRE_THAT(sink.buffer, ContainsSubstring("1/3 submissions passed all tests\n"));
    REQUIRE(sink.num_flushes == 1);
}

TEST_CASE("Single runs pass the program's output through") {
    StringSink sink;

    const ExecutionResult result{.stdout_data = "hello",
                                 .stderr_data = "oops\n",
                                 .exit_code = 3,
                                 .duration_seconds = 0.5,
                                 .outcome = ExecutionOutcome::Completed};

    SECTION("Quiet") {
        auto serializer = make_serializer(sink, VerbosityLevel::Quiet);
        serializer.on_execution_result(result);
        REQUIRE_THAT(sink.buffer, Equals("hello"));
    }

    SECTION("Summary") {
        auto serializer = make_serializer(sink, VerbosityLevel::Summary);
        serializer.on_execution_result(result);

        REQUIRE_THAT(sink.buffer, Catch::Matchers::StartsWith("hello\n-"));
        REQUIRE_THAT(sink.buffer, ContainsSubstring("Exited with code 3 after 0.500s\n"));
        REQUIRE_THAT(sink.buffer, ContainsSubstring("  stderr:\n    | oops\n"));
    }

    SECTION("Silent") {
        auto serializer = make_serializer(sink, VerbosityLevel::Silent);
        serializer.on_execution_result(result);
        serializer.finalize();
        REQUIRE(sink.buffer.empty());
    }
}

TEST_CASE("Compile failures show the compiler output instead") {
    StringSink sink;
    auto serializer = make_serializer(sink, VerbosityLevel::Summary);

    serializer.on_execution_result({.stdout_data = "warning: unused\n",
                                    .stderr_data = "main.c:1: error: expected ';'\n",
                                    .exit_code = 1,
                                    .duration_seconds = 0.0,
                                    .outcome = ExecutionOutcome::CompileFailed});

    REQUIRE_THAT(sink.buffer, Catch::Matchers::StartsWith("-"));
    REQUIRE_THAT(sink.buffer, ContainsSubstring("Compilation failed (exit code 1)\n"));
    REQUIRE_THAT(sink.buffer, ContainsSubstring("  compiler stdout:\n    | warning: unused\n"));
    REQUIRE_THAT(sink.buffer, ContainsSubstring("  stderr:\n    | main.c:1: error: expected ';'\n"));
}

TEST_CASE("A missing compiler is not reported as a run") {
    StringSink sink;
    auto serializer = make_serializer(sink, VerbosityLevel::Summary);

    serializer.on_execution_result({.stdout_data = "",
                                    .stderr_data = "Command not found: gcc",
                                    .exit_code = 127,
                                    .duration_seconds = 0.0,
                                    .outcome = ExecutionOutcome::CompilerNotFound});

    REQUIRE_THAT(sink.buffer, Catch::Matchers::StartsWith("-"));
    REQUIRE_THAT(sink.buffer, ContainsSubstring("Could not run the compiler (exit code 127)\n"));
    REQUIRE_THAT(sink.buffer, ContainsSubstring("  stderr:\n    | Command not found: gcc\n"));
    REQUIRE_FALSE(sink.buffer.find("Could not execute") != std::string::npos);
}
