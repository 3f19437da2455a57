#pragma once

#include <exegrader/execution/execution_result.hpp>
#include <exegrader/language/language_profile.hpp>
#include <exegrader/language/language_registry.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace exegrader {

/// One execution of submitted source code
struct ExecutionRequest
{
    std::string language;
    std::string source_code;

    /// Absent means no input at all: the program's first read sees EOF
    std::optional<std::string> stdin_data;

    /// Overrides the language profile's timeout, per step
    std::optional<std::chrono::seconds> timeout;
};

/// Compiles (if needed) and runs source code inside a fresh workspace, under a wall-clock timeout.
///
/// Every call is independent: it creates its own workspace, removed before the call returns (or
/// throws), and keeps no state between calls. Calls may run concurrently from several threads.
///
/// Failures of the submitted code (compile errors, crashes, timeouts, missing commands) are reported
/// as data in the ExecutionResult. Failures of the engine itself raise ExecutionError.
class ExecutionBackend
{
public:
    /// The source file is `SOURCE_STEM` + the profile's source extension
    static constexpr std::string_view SOURCE_STEM = "Main";
    static constexpr std::string_view BINARY_NAME = "app.out";

    explicit ExecutionBackend(const LanguageRegistry& registry);

    /// Throws UnsupportedLanguageError (before creating any workspace) for an unknown language
    ExecutionResult execute(const ExecutionRequest& request) const;

    ExecutionResult execute(std::string_view language, std::string_view source_code,
                            const std::optional<std::string>& stdin_data = std::nullopt,
                            std::optional<std::chrono::seconds> timeout = std::nullopt) const;

    /// Executes with an already resolved profile
    ExecutionResult execute(const LanguageProfile& profile, std::string_view source_code,
                            const std::optional<std::string>& stdin_data = std::nullopt,
                            std::optional<std::chrono::seconds> timeout = std::nullopt) const;

    const LanguageRegistry& get_registry() const { return *registry_; }

private:
    const LanguageRegistry* registry_;
};

} // namespace exegrader
