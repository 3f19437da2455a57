#include <exegrader/subprocess/run_result.hpp>

#include <libassert/assert.hpp>

#include <utility>

namespace exegrader {

RunResult::RunResult(Kind kind, int code)
    : kind_{kind}
    , code_{code} {}

RunResult RunResult::make_exited(int code) {
    return {Kind::Exited, code};
}

RunResult RunResult::make_killed(int signal) {
    ASSERT(signal > 0, "Signal numbers are positive");
    return {Kind::Killed, signal};
}

RunResult RunResult::make_timed_out() {
    return {Kind::TimedOut, -1};
}

RunResult::Kind RunResult::get_kind() const {
    return kind_;
}

int RunResult::get_code() const {
    return code_;
}

int RunResult::to_exit_code() const {
    switch (kind_) {
    case Kind::Exited:
        return code_;
    case Kind::Killed:
        return -code_;
    case Kind::TimedOut:
        return -1;
    }

    std::unreachable();
}

} // namespace exegrader
