#include "app/languages_app.hpp"

#include "output/stdout_sink.hpp"
#include "output/verbosity.hpp"

#include <exegrader/language/language_profile.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>

namespace exegrader {

int LanguagesApp::run_impl() {
    if (OPTS.verbosity == VerbosityLevel::Silent) {
        return 0;
    }

    StdoutSink sink;

    // Bare ids when quiet, for use in scripts
    if (OPTS.verbosity == VerbosityLevel::Quiet) {
        for (const LanguageProfile& profile : get_registry().get_profiles()) {
            sink.write(fmt::format("{}\n", profile.id));
        }
        sink.flush();
        return 0;
    }

    sink.write(fmt::format("{:<10} {:<6} {:>8}  {}\n", "LANGUAGE", "EXT", "TIMEOUT", "COMMANDS"));

    for (const LanguageProfile& profile : get_registry().get_profiles()) {
        std::string commands;
        if (profile.compile_command) {
            commands = fmt::format("{} && ", fmt::join(*profile.compile_command, " "));
        }
        commands += fmt::format("{}", fmt::join(profile.run_command, " "));

        sink.write(fmt::format("{:<10} {:<6} {:>7}s  {}\n", profile.id, profile.source_extension,
                               profile.timeout.count(), commands));
    }

    sink.flush();

    return 0;
}

} // namespace exegrader
