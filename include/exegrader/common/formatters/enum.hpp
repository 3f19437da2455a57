#pragma once

#include <exegrader/common/formatters/debug.hpp>

#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/type_index.hpp>
#include <fmt/format.h>

#include <type_traits>

namespace exegrader {

/// Enumerations annotated with BOOST_DESCRIBE_ENUM / BOOST_DESCRIBE_NESTED_ENUM
template <typename Enum>
concept DescribedEnum = std::is_enum_v<Enum> && boost::describe::has_describe_enumerators<Enum>::value;

} // namespace exegrader

/// Formats a described enumerator by name, e.g. "TimedOut".
/// With the debug specifier (`{:?}`), the type name is included: "exegrader::ErrorKind{TimedOut}".
/// Values without an enumerator are written as "<unknown (N)>".
template <::exegrader::DescribedEnum Enum>
struct fmt::formatter<Enum> : ::exegrader::DebugFormatter
{
    auto format(const Enum& from, fmt::format_context& ctx) const {
        const char* name = boost::describe::enum_to_string(from, nullptr);

        if (name == nullptr) {
            return fmt::format_to(ctx.out(), "<unknown ({})>", fmt::underlying(from));
        }

        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "{}{{{}}}", boost::typeindex::type_id<Enum>().pretty_name(), name);
        }

        return fmt::format_to(ctx.out(), "{}", name);
    }
};
