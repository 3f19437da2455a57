#include "app/batch_runner.hpp"

#include "common/files.hpp"

#include <exegrader/exceptions.hpp>
#include <exegrader/execution/execution_backend.hpp>
#include <exegrader/grading/test_case.hpp>
#include <exegrader/grading/test_harness.hpp>
#include <exegrader/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <future>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace exegrader {

SubmissionOutcome grade_submission_file(const TestHarness& harness, std::span<const TestCase> test_cases,
                                        const Submission& submission) {
    DEBUG_ASSERT(submission.profile != nullptr);

    auto source_code = read_file(submission.path);
    if (!source_code) {
        return SubmissionOutcome{.verdict = std::nullopt,
                                 .error = fmt::format("Could not read {}", submission.path.string())};
    }

    try {
        return SubmissionOutcome{
            .verdict = harness.grade_submission(test_cases, submission.profile->id, *source_code), .error = {}};
    } catch (const GraderError& err) {
        LOG_WARN("Grading {} failed: {}", submission.path, err);
        return SubmissionOutcome{.verdict = std::nullopt, .error = err.what()};
    }
}

BatchRunner::BatchRunner(const ExecutionBackend& backend, HarnessOptions options,
                         std::span<const TestCase> test_cases, int num_jobs)
    : harness_{backend, options}
    , test_cases_{test_cases}
    , num_jobs_{gsl::narrow_cast<std::size_t>(num_jobs)} {
    ASSERT(num_jobs >= 1);
}

void BatchRunner::run(std::span<const Submission> submissions, const OutcomeCallback& on_outcome) const {
    std::vector<std::promise<SubmissionOutcome>> promises(submissions.size());
    std::vector<std::future<SubmissionOutcome>> futures;
    futures.reserve(promises.size());
    for (auto& promise : promises) {
        futures.push_back(promise.get_future());
    }

    std::atomic<std::size_t> next_index{0};

    auto worker = [&] {
        for (std::size_t idx = next_index++; idx < submissions.size(); idx = next_index++) {
            try {
                promises[idx].set_value(grade_submission_file(harness_, test_cases_, submissions[idx]));
            } catch (...) {
                promises[idx].set_exception(std::current_exception());
            }
        }
    };

    const std::size_t num_workers = std::min(num_jobs_, submissions.size());
    LOG_DEBUG("Grading {} submissions on {} workers", submissions.size(), num_workers);

    // Declared after the promises, so that the workers are joined before those are destroyed
    std::vector<std::jthread> workers;
    workers.reserve(num_workers);
    for (std::size_t i = 0; i < num_workers; ++i) {
        workers.emplace_back(worker);
    }

    for (std::size_t i = 0; i < futures.size(); ++i) {
        on_outcome(submissions[i], futures[i].get());
    }
}

} // namespace exegrader
