#include "app/run_app.hpp"

#include "common/files.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/serializer.hpp"
#include "output/stdout_sink.hpp"
#include "user/program_options.hpp"
#include "version.hpp"

#include <exegrader/common/error_types.hpp>
#include <exegrader/exceptions.hpp>
#include <exegrader/execution/execution_backend.hpp>
#include <exegrader/execution/execution_result.hpp>
#include <exegrader/language/language_profile.hpp>
#include <exegrader/logging.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>

namespace exegrader {

int RunApp::exit_status_of(const ExecutionResult& result) {
    constexpr int SIGNAL_EXIT_BASE = 128;
    constexpr int MAX_EXIT_STATUS = 255;

    if (result.timed_out()) {
        return EXIT_TIMED_OUT;
    }

    // Killed by a signal
    if (result.exit_code < 0) {
        return std::min(SIGNAL_EXIT_BASE - result.exit_code, MAX_EXIT_STATUS);
    }

    return std::min(result.exit_code, MAX_EXIT_STATUS);
}

int RunApp::run_impl() {
    const auto& file = OPTS.files.front();

    auto profile = OPTS.profile_for(file, get_registry());
    if (!profile) {
        throw UnsupportedLanguageError{OPTS.language.value_or(file.extension().string())};
    }

    auto source_code = read_file(file);
    if (!source_code) {
        throw GraderError{source_code.error(), fmt::format("Could not read {}", file.string())};
    }

    std::optional<std::string> stdin_data;
    if (OPTS.stdin_file) {
        auto input = read_file(*OPTS.stdin_file);
        if (!input) {
            throw GraderError{input.error(), fmt::format("Could not read {}", OPTS.stdin_file->string())};
        }
        stdin_data = std::move(input).value();
    }

    std::optional<std::chrono::seconds> timeout;
    if (OPTS.timeout_seconds) {
        timeout = std::chrono::seconds{*OPTS.timeout_seconds};
    }

    StdoutSink sink;
    PlainTextSerializer serializer{sink, OPTS.colorize_option, OPTS.verbosity};

    serializer.on_run_metadata(
        {.version_string = EXEGRADER_VERSION_STRING, .start_time = std::chrono::system_clock::now()});
    serializer.on_submission_begin({.path = file, .language = profile->get().id, .exercise_id = std::nullopt});

    const ExecutionBackend backend{get_registry()};
    const ExecutionResult result = backend.execute(profile->get(), *source_code, stdin_data, timeout);

    LOG_DEBUG("{}", result);

    serializer.on_execution_result(result);
    serializer.finalize();

    return exit_status_of(result);
}

} // namespace exegrader
