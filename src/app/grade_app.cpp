#include "app/grade_app.hpp"

#include "app/batch_runner.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/serializer.hpp"
#include "output/stdout_sink.hpp"
#include "user/program_options.hpp"
#include "version.hpp"

#include <exegrader/exceptions.hpp>
#include <exegrader/execution/execution_backend.hpp>
#include <exegrader/grading/exercise_store.hpp>
#include <exegrader/grading/progress.hpp>
#include <exegrader/grading/test_case.hpp>
#include <exegrader/grading/test_harness.hpp>
#include <exegrader/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace exegrader {

namespace {

HarnessOptions harness_options_of(const ProgramOptions& opts) {
    return {.short_circuit = opts.short_circuit ? ShortCircuitPolicy::StopOnNonZeroExit : ShortCircuitPolicy::Never,
            .honor_test_timeouts = opts.honor_test_timeouts};
}

} // namespace

std::vector<Submission> GradeApp::collect_submissions(const ProgramOptions& opts, const LanguageRegistry& registry) {
    std::vector<Submission> submissions;
    submissions.reserve(opts.files.size());

    for (const auto& file : opts.files) {
        auto profile = opts.profile_for(file, registry);
        if (!profile) {
            throw UnsupportedLanguageError{opts.language.value_or(file.extension().string())};
        }
        const LanguageProfile& resolved = profile->get();
        submissions.push_back({.path = file, .profile = &resolved, .language = opts.language.value_or(resolved.id)});
    }

    return submissions;
}

int GradeApp::run_impl() {
    const DirectoryExerciseStore store{OPTS.tests_dir};

    // Loaded once; every submission is graded against the same tests
    const std::vector<TestCase> test_cases = TestHarness::load_test_cases(store, OPTS.exercise_id);
    LOG_DEBUG("Exercise {:?} has {} tests", OPTS.exercise_id, test_cases.size());

    const std::vector<Submission> submissions = collect_submissions(OPTS, get_registry());

    StdoutSink sink;
    PlainTextSerializer serializer{sink, OPTS.colorize_option, OPTS.verbosity};
    serializer.on_run_metadata(
        {.version_string = EXEGRADER_VERSION_STRING, .start_time = std::chrono::system_clock::now()});

    const ExecutionBackend backend{get_registry()};
    LoggingProgressRecorder recorder;

    const int num_failed = OPTS.jobs > 1 && submissions.size() > 1
                               ? grade_in_parallel(backend, test_cases, submissions, serializer, recorder)
                               : grade_sequentially(backend, test_cases, submissions, serializer, recorder);

    serializer.finalize();

    return std::min(num_failed, MAX_EXIT_STATUS);
}

int GradeApp::grade_sequentially(const ExecutionBackend& backend, const std::vector<TestCase>& test_cases,
                                 const std::vector<Submission>& submissions, Serializer& serializer,
                                 ProgressRecorder& recorder) const {
    TestHarness harness{backend, harness_options_of(OPTS)};
    harness.set_test_begin_callback([&serializer](const TestCase& test) { serializer.on_test_begin(test); });
    harness.set_result_callback([&serializer](const TestCaseResult& res) { serializer.on_test_result(res); });

    int num_failed = 0;

    for (const Submission& submission : submissions) {
        serializer.on_submission_begin(
            {.path = submission.path, .language = submission.profile->id, .exercise_id = OPTS.exercise_id});

        const SubmissionOutcome outcome = grade_submission_file(harness, test_cases, submission);

        if (!finish_submission(submission, outcome, test_cases.size(), serializer, recorder)) {
            ++num_failed;
        }
    }

    return num_failed;
}

int GradeApp::grade_in_parallel(const ExecutionBackend& backend, const std::vector<TestCase>& test_cases,
                                const std::vector<Submission>& submissions, Serializer& serializer,
                                ProgressRecorder& recorder) const {
    const BatchRunner runner{backend, harness_options_of(OPTS), test_cases, OPTS.jobs};
    int num_failed = 0;

    runner.run(submissions, [&](const Submission& submission, const SubmissionOutcome& outcome) {
        serializer.on_submission_begin(
            {.path = submission.path, .language = submission.profile->id, .exercise_id = OPTS.exercise_id});

        // Replay the per-test events; results line up with the tests they were run for
        if (outcome.verdict) {
            const auto& results = outcome.verdict->results;
            DEBUG_ASSERT(results.size() <= test_cases.size());

            for (std::size_t i = 0; i < results.size(); ++i) {
                serializer.on_test_begin(test_cases[i]);
                serializer.on_test_result(results[i]);
            }
        }

        if (!finish_submission(submission, outcome, test_cases.size(), serializer, recorder)) {
            ++num_failed;
        }
    });

    return num_failed;
}

bool GradeApp::finish_submission(const Submission& submission, const SubmissionOutcome& outcome,
                                 std::size_t num_tests, Serializer& serializer, ProgressRecorder& recorder) const {
    if (!outcome.verdict) {
        serializer.on_error(fmt::format("Could not grade {}: {}", submission.path.string(), outcome.error));
        return false;
    }

    serializer.on_verdict(*outcome.verdict, num_tests);

    recorder.upsert(OPTS.student_id, OPTS.exercise_id, make_progress_record(*outcome.verdict, submission.language));

    return outcome.passed();
}

} // namespace exegrader
