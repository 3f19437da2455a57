#pragma once

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <exegrader/common/class_traits.hpp>
#include <exegrader/exceptions.hpp>
#include <exegrader/language/language_registry.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstdio>
#include <optional>
#include <utility>

namespace exegrader {

class App : NonCopyable
{
public:
    App(ProgramOptions opts, const LanguageRegistry& registry)
        : OPTS{std::move(opts)}
        , registry_{&registry} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    /// Exit status of the application. GraderErrors are configuration errors; anything else
    /// escaping `run_impl` is reported with a stacktrace.
    int run() noexcept {
        std::optional res = wrap_throwable_fn([this] {
            try {
                return run_impl();
            } catch (const GraderError& err) {
                fmt::println(stderr, "{}", fmt::styled(err.what(), fmt::fg(fmt::color::red)));
                return EXIT_CONFIG_ERROR;
            }
        });

        return res.value_or(EXIT_INTERNAL_ERROR);
    }

    const ProgramOptions OPTS;

    static constexpr int EXIT_CONFIG_ERROR = 2;
    static constexpr int EXIT_INTERNAL_ERROR = 3;

protected:
    virtual int run_impl() = 0;

    const LanguageRegistry& get_registry() const noexcept { return *registry_; }

private:
    const LanguageRegistry* registry_;
};

} // namespace exegrader
