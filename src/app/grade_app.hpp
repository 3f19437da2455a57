#pragma once

#include "app/app.hpp" // IWYU pragma: export
#include "app/batch_runner.hpp"
#include "user/program_options.hpp"

#include <exegrader/grading/test_case.hpp>
#include <exegrader/language/language_registry.hpp>

#include <cstddef>
#include <vector>

namespace exegrader {

class ProgressRecorder;
class Serializer;

/// `exegrader grade`: grades every given file against the tests of one exercise
class GradeApp final : public App
{
public:
    using App::App;

    static constexpr int MAX_EXIT_STATUS = 255;

    /// Resolves the language of every file of `opts`; throws UnsupportedLanguageError for the first
    /// that has none
    static std::vector<Submission> collect_submissions(const ProgramOptions& opts, const LanguageRegistry& registry);

private:
    int run_impl() override;

    /// Grades on the calling thread, reporting every test as soon as it finishes.
    /// Returns the number of submissions that did not pass.
    int grade_sequentially(const ExecutionBackend& backend, const std::vector<TestCase>& test_cases,
                           const std::vector<Submission>& submissions, Serializer& serializer,
                          ProgressRecorder& recorder) const;

    /// Grades on a pool of workers, reporting each submission once it and all before it are done.
    /// Returns the number of submissions that did not pass.
    int grade_in_parallel(const ExecutionBackend& backend, const std::vector<TestCase>& test_cases,
                          const std::vector<Submission>& submissions, Serializer& serializer,
                          ProgressRecorder& recorder) const;

    /// Reports the end of one submission. Returns whether it passed.
    bool finish_submission(const Submission& submission, const SubmissionOutcome& outcome,
                           std::size_t num_tests, Serializer& serializer, ProgressRecorder& recorder) const;
};

} // namespace exegrader
