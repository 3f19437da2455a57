#include <exegrader/execution/command_builder.hpp>

#include <exegrader/language/language_profile.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace exegrader {

std::string substitute_placeholders(std::string_view token, const CommandPaths& paths) {
    std::string result;
    result.reserve(token.size());

    while (!token.empty()) {
        const auto brace = token.find('{');

        result.append(token.substr(0, brace));

        if (brace == std::string_view::npos) {
            break;
        }

        token.remove_prefix(brace);

        if (token.starts_with(SOURCE_PLACEHOLDER)) {
            result.append(paths.source.string());
            token.remove_prefix(SOURCE_PLACEHOLDER.size());
        } else if (token.starts_with(BINARY_PLACEHOLDER)) {
            result.append(paths.binary.string());
            token.remove_prefix(BINARY_PLACEHOLDER.size());
        } else {
            // A lone brace which is not part of a placeholder
            result.push_back('{');
            token.remove_prefix(1);
        }
    }

    return result;
}

std::vector<std::string> build_command(std::span<const std::string> command_template, const CommandPaths& paths) {
    return command_template |
           ranges::views::transform([&paths](const std::string& token) { return substitute_placeholders(token, paths); }) |
           ranges::to<std::vector>();
}

} // namespace exegrader
