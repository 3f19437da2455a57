#pragma once

#include <fmt/format.h>

namespace exegrader {

/// Base for fmt::formatter specializations that accept a single optional `?` specifier,
/// selecting a more verbose (debug) representation.
struct DebugFormatter
{
    bool is_debug_format = false;

    constexpr auto parse(fmt::format_parse_context& ctx) {
        const auto* it = ctx.begin();
        const auto* end = ctx.end();

        if (it != end && *it == '?') {
            is_debug_format = true;
            ++it;
        }

        return it;
    }
};

} // namespace exegrader
