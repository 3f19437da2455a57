#pragma once

#include "app/app.hpp" // IWYU pragma: export

#include <exegrader/execution/execution_result.hpp>

namespace exegrader {

/// `exegrader run`: executes one file and passes its output through
class RunApp final : public App
{
public:
    using App::App;

    /// Process exit status mirroring the outcome of an execution:
    /// the exit code clamped to 0..255, 128+N for a death by signal N, 124 for a timeout
    static int exit_status_of(const ExecutionResult& result);

    static constexpr int EXIT_TIMED_OUT = 124;

private:
    int run_impl() override;
};

} // namespace exegrader
