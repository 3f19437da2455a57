#pragma once

#include <exegrader/common/class_traits.hpp>
#include <exegrader/execution/execution_result.hpp>
#include <exegrader/grading/test_case.hpp>

#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace exegrader {

struct RunMetadata
{
    std::string version_string;
    std::chrono::system_clock::time_point start_time;
};

/// What is being executed or graded
struct SubmissionInfo
{
    std::filesystem::path path;
    std::string language;

    /// Absent for plain runs
    std::optional<std::string> exercise_id;
};

/// Renders the events of a CLI session to a sink.
/// Events of one submission arrive in order: on_submission_begin, then either on_execution_result, or
/// (on_test_begin, on_test_result) per test followed by on_verdict.
class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_run_metadata(const RunMetadata& data) = 0;
    virtual void on_submission_begin(const SubmissionInfo& info) = 0;
    virtual void on_execution_result(const ExecutionResult& data) = 0;
    virtual void on_test_begin(const TestCase& test) = 0;
    virtual void on_test_result(const TestCaseResult& data) = 0;
    /// `num_tests` is the number of tests the submission was graded against; `data.results` may be shorter
    virtual void on_verdict(const GradingVerdict& data, std::size_t num_tests) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace exegrader
