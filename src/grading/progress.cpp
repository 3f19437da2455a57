#include <exegrader/grading/progress.hpp>

#include <exegrader/grading/test_case.hpp>
#include <exegrader/logging.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace exegrader {

ProgressRecord make_progress_record(const GradingVerdict& verdict, std::string_view language,
                                    std::chrono::system_clock::time_point now) {
    ProgressRecord record{.status = verdict.passed_all ? ProgressStatus::Passed : ProgressStatus::Failed,
                          .last_error = std::nullopt,
                          .last_run_output = {},
                          .completed_at = std::nullopt,
                          .last_language = std::string{language}};

    if (!verdict.results.empty()) {
        record.last_run_output = verdict.results.back().stdout_data;
    }

    if (verdict.passed_all) {
        record.completed_at = now;
    } else if (!verdict.results.empty()) {
        record.last_error = verdict.results.back().stderr_data;
    }

    return record;
}

void LoggingProgressRecorder::upsert(std::string_view student_id, std::string_view exercise_id,
                                     const ProgressRecord& record) {
    LOG_INFO("Progress of {:?} on {:?}: {}", student_id, exercise_id, record);
    LOG_DEBUG("Full record: {:?}", record);
}

} // namespace exegrader
