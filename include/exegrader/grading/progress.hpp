#pragma once

#include <exegrader/common/formatters/debug.hpp>
#include <exegrader/common/formatters/enum.hpp>
#include <exegrader/grading/test_case.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace exegrader {

enum class ProgressStatus { Passed, Failed };
BOOST_DESCRIBE_ENUM(ProgressStatus, Passed, Failed)

/// A student's standing on one exercise after their latest graded attempt
struct ProgressRecord
{
    ProgressStatus status{ProgressStatus::Failed};

    /// stderr of the last executed test; absent when every test passed
    std::optional<std::string> last_error;

    /// stdout of the last executed test
    std::string last_run_output;

    /// Set only when every test passed
    std::optional<std::chrono::system_clock::time_point> completed_at;

    std::string last_language;

    bool operator==(const ProgressRecord&) const = default;
};

/// Derives the progress record of a graded attempt
ProgressRecord make_progress_record(const GradingVerdict& verdict, std::string_view language,
                                    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

/// Consumer of graded attempts (e.g., a database of student progress)
class ProgressRecorder
{
public:
    virtual ~ProgressRecorder() = default;

    /// Creates or replaces the record of (`student_id`, `exercise_id`)
    virtual void upsert(std::string_view student_id, std::string_view exercise_id, const ProgressRecord& record) = 0;
};

/// Writes every record to the log instead of storing it
class LoggingProgressRecorder : public ProgressRecorder
{
public:
    void upsert(std::string_view student_id, std::string_view exercise_id, const ProgressRecord& record) override;
};

} // namespace exegrader

template <>
struct fmt::formatter<::exegrader::ProgressRecord> : ::exegrader::DebugFormatter
{
    auto format(const ::exegrader::ProgressRecord& from, fmt::format_context& ctx) const {
        auto out = fmt::format_to(ctx.out(), "{} in {}", from.status, from.last_language);

        if (from.completed_at) {
            out = fmt::format_to(out, ", completed at {:%Y-%m-%d %H:%M:%S}", *from.completed_at);
        }

        if (is_debug_format) {
            out = fmt::format_to(out, ", output={:?}", from.last_run_output);
            if (from.last_error) {
                out = fmt::format_to(out, ", error={:?}", *from.last_error);
            }
        }

        return out;
    }
};
