#pragma once

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace exegrader {

/// Concrete paths substituted for the placeholders of a command template
struct CommandPaths
{
    std::filesystem::path source;
    std::filesystem::path binary;
};

/// Replaces every `{source}` and `{binary}` occurrence within a single token.
/// Text around a placeholder is kept as is (e.g., "-o{binary}").
std::string substitute_placeholders(std::string_view token, const CommandPaths& paths);

/// Builds the argument vector of a command template: one output argument per input token.
///
/// The result is meant to be passed to exec directly. No shell is involved, so paths
/// containing spaces or shell metacharacters are passed through verbatim.
std::vector<std::string> build_command(std::span<const std::string> command_template, const CommandPaths& paths);

} // namespace exegrader
