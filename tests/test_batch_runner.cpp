#include "catch2_custom.hpp"

#include "app/batch_runner.hpp"

#include <exegrader/execution/execution_backend.hpp>
#include <exegrader/grading/test_case.hpp>
#include <exegrader/grading/test_harness.hpp>
#include <exegrader/language/language_profile.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

using exegrader::BatchRunner;
using exegrader::ExecutionBackend;
using exegrader::HarnessOptions;
using exegrader::Submission;
using exegrader::SubmissionOutcome;
using exegrader::TestCase;

namespace {

const std::vector<TestCase> DOUBLE_TESTS{
    {.id = 1, .input_data = "1\n", .expected_output = "2\n", .timeout = std::nullopt, .is_hidden = false},
    {.id = 2, .input_data = "21\n", .expected_output = "42\n", .timeout = std::nullopt, .is_hidden = false},
};

} // namespace

TEST_CASE("Outcomes are reported in input order") {
    const auto registry = shell_registry();
    const ExecutionBackend backend{registry};
    const auto scratch = make_scratch_dir();
    const exegrader::LanguageProfile& shell = registry.get("sh");

    // Earlier submissions take longer, so that they finish last
    constexpr int num_submissions = 6;
    std::vector<Submission> submissions;
    for (int i = 0; i < num_submissions; ++i) {
        const bool correct = i % 2 == 0;
        const std::string name = fmt::format("student{}.sh", i);
        const std::string source = fmt::format("sleep 0.{}; read n; echo $((n * {}))", num_submissions - i,
                                               correct ? 2 : 3);

        REQUIRE(scratch.write_file(name, source));
        submissions.push_back({.path = scratch.file(name), .profile = &shell});
    }

    const BatchRunner runner{backend, HarnessOptions{}, DOUBLE_TESTS, 4};

    std::vector<std::string> seen;
    std::vector<bool> passed;
    runner.run(submissions, [&](const Submission& submission, const SubmissionOutcome& outcome) {
        seen.push_back(submission.path.filename().string());
        passed.push_back(outcome.passed());

        REQUIRE(outcome.verdict.has_value());
        REQUIRE(outcome.error.empty());
        REQUIRE(outcome.verdict->results.size() == DOUBLE_TESTS.size());
    });

    REQUIRE(seen == std::vector<std::string>{"student0.sh", "student1.sh", "student2.sh", "student3.sh",
                                             "student4.sh", "student5.sh"});
    REQUIRE(passed == std::vector<bool>{true, false, true, false, true, false});
}

TEST_CASE("A single job grades sequentially") {
    const auto registry = shell_registry();
    const ExecutionBackend backend{registry};
    const auto scratch = make_scratch_dir();

    REQUIRE(scratch.write_file("a.sh", "read n; echo $((n + n))"));
    const std::vector<Submission> submissions{{.path = scratch.file("a.sh"), .profile = &registry.get("sh")}};

    const BatchRunner runner{backend, HarnessOptions{}, DOUBLE_TESTS, 1};

    int num_outcomes = 0;
    runner.run(submissions, [&](const Submission&, const SubmissionOutcome& outcome) {
        ++num_outcomes;
        REQUIRE(outcome.passed());
    });

    REQUIRE(num_outcomes == 1);
}

TEST_CASE("No submissions, no outcomes") {
    const auto registry = shell_registry();
    const ExecutionBackend backend{registry};
    const BatchRunner runner{backend, HarnessOptions{}, DOUBLE_TESTS, 3};

    bool called = false;
    runner.run({}, [&](const Submission&, const SubmissionOutcome&) { called = true; });

    REQUIRE_FALSE(called);
}

TEST_CASE("Unreadable submissions become errors without affecting the others") {
    const auto registry = shell_registry();
    const ExecutionBackend backend{registry};
    const auto scratch = make_scratch_dir();
    const exegrader::LanguageProfile& shell = registry.get("sh");

    REQUIRE(scratch.write_file("good.sh", "read n; echo $((n * 2))"));

    const std::vector<Submission> submissions{
        {.path = scratch.file("missing.sh"), .profile = &shell},
        {.path = scratch.file("good.sh"), .profile = &shell},
    };

    const BatchRunner runner{backend, HarnessOptions{}, DOUBLE_TESTS, 2};

    std::vector<SubmissionOutcome> outcomes;
    runner.run(submissions,
               [&](const Submission&, const SubmissionOutcome& outcome) { outcomes.push_back(outcome); });

    REQUIRE(outcomes.size() == 2);

    REQUIRE_FALSE(outcomes[0].verdict.has_value());
    REQUIRE_FALSE(outcomes[0].passed());
    REQUIRE_THAT(outcomes[0].error, Catch::Matchers::StartsWith("Could not read "));
    REQUIRE_THAT(outcomes[0].error, Catch::Matchers::EndsWith("missing.sh"));

    REQUIRE(outcomes[1].passed());
}

TEST_CASE("Grading errors of a single file are captured") {
    const auto registry = shell_registry();
    const ExecutionBackend backend{registry};
    const exegrader::TestHarness harness{backend};
    const auto scratch = make_scratch_dir();

    REQUIRE(scratch.write_file("a.sh", "echo hi"));
    const Submission submission{.path = scratch.file("a.sh"), .profile = &registry.get("sh")};

    // No tests configured
    const SubmissionOutcome outcome = exegrader::grade_submission_file(harness, {}, submission);

    REQUIRE_FALSE(outcome.verdict.has_value());
    REQUIRE_FALSE(outcome.error.empty());
}
