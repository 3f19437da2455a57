#pragma once

#include <exegrader/common/formatters/debug.hpp>
#include <exegrader/common/formatters/enum.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/format.h>

namespace exegrader {

/// How a child process ended
class RunResult
{
public:
    enum class Kind { Exited, Killed, TimedOut };
    BOOST_DESCRIBE_NESTED_ENUM(Kind, Exited, Killed, TimedOut);

    /// Normal termination with `code` as the exit status
    static RunResult make_exited(int code);
    /// Termination by the signal `signal`
    static RunResult make_killed(int signal);
    /// The process was killed by the runner after its deadline passed
    static RunResult make_timed_out();

    Kind get_kind() const;
    int get_code() const;

    /// Exit code in the convention of the execution results:
    ///   Exited -> the exit status
    ///   Killed -> the negated signal number
    ///   TimedOut -> -1
    int to_exit_code() const;

    bool operator==(const RunResult&) const = default;

private:
    RunResult(Kind kind, int code);

    Kind kind_;
    int code_;
};

} // namespace exegrader

template <>
struct fmt::formatter<::exegrader::RunResult> : ::exegrader::DebugFormatter
{
    auto format(const ::exegrader::RunResult& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "RunResult{{kind={}, code={}}}", from.get_kind(), from.get_code());
    }
};
