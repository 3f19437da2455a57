#pragma once

#include <exegrader/execution/execution_backend.hpp>
#include <exegrader/grading/test_case.hpp>
#include <exegrader/grading/test_harness.hpp>
#include <exegrader/language/language_profile.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace exegrader {

/// One source file to be graded
struct Submission
{
    std::filesystem::path path;
    const LanguageProfile* profile;
    /// Language as the caller named it, before resolution to `profile`
    std::string language;
};

/// Either the verdict of a submission, or why it could not be graded
struct SubmissionOutcome
{
    std::optional<GradingVerdict> verdict;
    std::string error;

    bool passed() const { return verdict && verdict->passed_all; }
};

/// Reads and grades one submission on the calling thread. A GraderError or an unreadable file
/// becomes the outcome's error.
SubmissionOutcome grade_submission_file(const TestHarness& harness, std::span<const TestCase> test_cases,
                                        const Submission& submission);

/// Grades independent submissions against the same test cases on a fixed pool of worker threads.
///
/// Each worker grades whole submissions, one at a time; the tests of one submission still run
/// strictly in order. Outcomes are handed back on the calling thread, in input order, as soon as
/// all earlier ones are available.
class BatchRunner
{
public:
    using OutcomeCallback = std::function<void(const Submission&, const SubmissionOutcome&)>;

    BatchRunner(const ExecutionBackend& backend, HarnessOptions options, std::span<const TestCase> test_cases,
                int num_jobs);

    /// Exceptions other than GraderError thrown while grading are rethrown here, in input order
    void run(std::span<const Submission> submissions, const OutcomeCallback& on_outcome) const;

private:
    TestHarness harness_;
    std::span<const TestCase> test_cases_;
    std::size_t num_jobs_;
};

} // namespace exegrader
