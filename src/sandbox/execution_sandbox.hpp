#pragma once

#include "pipeline/evaluation_context.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/grading_session.hpp>

#include <cstddef>

namespace polygrader {

struct SandboxOptions
{
    std::size_t output_cap_bytes = 64 * 1024;
};

/// Runs a built submission once, under its language's time and memory limits,
/// inside the run's workspace and process group.
///
/// Everything the program does (exit codes, signals, timeouts, runaway memory or output)
/// ends up in the returned `ExecutionResult`; only environment problems are errors.
class ExecutionSandbox
{
public:
    explicit ExecutionSandbox(SandboxOptions options)
        : options_{options} {}

    /// ``build`` must have succeeded
    Result<ExecutionResult> run(const Submission& submission, const Detection& detection, const BuildResult& build,
                                const EvaluationContext& ctx) const;

private:
    SandboxOptions options_;
};

} // namespace polygrader
