#include "app/app.hpp"
#include "app/grade_app.hpp"
#include "app/languages_app.hpp"
#include "app/run_app.hpp"
#include "app/trace_exception.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <exegrader/language/language_registry.hpp>
#include <exegrader/logging.hpp>

#include <libassert/assert.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <utility>

using namespace exegrader;

int main(int argc, const char* argv[]) {
    init_loggers();

    // Constructing the registry validates the built-in profiles
    std::optional<LanguageRegistry> registry = wrap_throwable_fn(&LanguageRegistry::with_defaults);
    if (!registry) {
        return App::EXIT_INTERNAL_ERROR;
    }

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    ProgramOptions options = parse_args_or_exit(args, *registry, App::EXIT_CONFIG_ERROR);

    std::unique_ptr<App> app;

    switch (options.command) {
    case ProgramOptions::Command::Run:
        app = std::make_unique<RunApp>(std::move(options), *registry);
        break;
    case ProgramOptions::Command::Grade:
        app = std::make_unique<GradeApp>(std::move(options), *registry);
        break;
    case ProgramOptions::Command::Languages:
        app = std::make_unique<LanguagesApp>(std::move(options), *registry);
        break;
    default:
        UNREACHABLE(options.command);
    }

    return app->run();
}
