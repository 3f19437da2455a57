#pragma once

#include <exegrader/common/formatters/enum.hpp>

#include <boost/describe/enum.hpp>

namespace exegrader {

/// How much the CLI writes to stdout. Each level includes everything of the levels below it.
///   Silent  - nothing; only the exit status tells the outcome
///   Quiet   - the program's own output (run), one verdict line per submission (grade)
///   Summary - plus a header per submission, failed tests with their evidence, and a summary
///   All     - plus passing tests
///   Extra   - plus the output of passing tests and run metadata
/// `Max` is just used as a sentinel
enum class VerbosityLevel { Silent, Quiet, Summary, All, Extra, Max };
BOOST_DESCRIBE_ENUM(VerbosityLevel, Silent, Quiet, Summary, All, Extra, Max)

/// See \ref VerbosityLevel
constexpr bool should_output_run_metadata(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Extra;
}

/// See \ref VerbosityLevel
constexpr bool should_output_submission_header(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

/// See \ref VerbosityLevel
constexpr bool should_output_test(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return level >= All || (level >= Summary && !passed);
}

/// See \ref VerbosityLevel
constexpr bool should_output_test_details(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return level >= Extra || (level >= Summary && !passed);
}

/// See \ref VerbosityLevel
constexpr bool should_output_verdict(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Quiet;
}

/// See \ref VerbosityLevel
constexpr bool should_output_program_output(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Quiet;
}

/// See \ref VerbosityLevel
constexpr bool should_output_execution_status(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

} // namespace exegrader
