#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace exegrader {

/// Placeholder tokens recognized within compile/run command tokens
inline constexpr std::string_view SOURCE_PLACEHOLDER = "{source}";
inline constexpr std::string_view BINARY_PLACEHOLDER = "{binary}";

/// Describes how to (optionally) compile and run source code of one language
struct LanguageProfile
{
    /// Registry key; looked up case-insensitively
    std::string id;

    /// Extension of the generated source file, including the dot (e.g., ".py")
    std::string source_extension;

    /// Absent for interpreted languages. Must exit with 0 before `run_command` is attempted.
    std::optional<std::vector<std::string>> compile_command;

    /// Never empty
    std::vector<std::string> run_command;

    /// Default per-step timeout, when the caller does not override it
    std::chrono::seconds timeout{};

    bool is_compiled() const noexcept { return compile_command.has_value(); }
};

} // namespace exegrader
