#include "sandbox/execution_sandbox.hpp"

#include "common/which.hpp"
#include "subprocess/run_result.hpp"
#include "subprocess/subprocess.hpp"
#include "toolchain/command_template.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/common/linux.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <libassert/assert.hpp>

namespace polygrader {

Result<ExecutionResult> ExecutionSandbox::run(const Submission& submission, const Detection& detection,
                                              const BuildResult& build, const EvaluationContext& ctx) const {
    ASSERT(build.success, "only successful builds can be run");

    const LanguageProfile& language = detection.language();

    auto argv = expand_command(language.run_command, make_command_vars(submission, detection));
    if (!argv) {
        LOG_ERROR("Bad run command for {}: {}", language.name, argv.error());
        return ErrorKind::InvalidConfig;
    }

    const auto program = which(argv->front(), ctx.workdir);
    if (!program) {
        // A missing build output is caught by the build step, so this is the runtime itself
        LOG_ERROR("Runtime '{}' for {} not found", argv->front(), language.name);
        return ErrorKind::ToolchainMissing;
    }

    Subprocess proc{*program, std::move(argv).value(), ctx.workdir};

    TRY(proc.start(ProcessLimits{
        .wall_timeout = language.run_timeout,
        .memory_limit_kb = language.memory_limit_kb,
        .limit_address_space = language.limit_address_space,
        .output_cap_bytes = options_.output_cap_bytes,
    }));

    const RunResult run = TRY(proc.wait_for_exit(ctx.stop_token));

    ExecutionResult res{
        .exit_code = run.get_exit_code(),
        .signal = run.get_signal(),
        .timed_out = run.get_kind() == RunResult::Kind::TimedOut,
        .memory_exceeded = run.get_kind() == RunResult::Kind::MemoryExceeded,
        .duration = run.get_usage().wall_time,
        .peak_memory_kb = run.get_usage().peak_memory_kb,
        .stdout_capture = proc.get_stdout(),
        .stderr_capture = proc.get_stderr(),
        .state = ExecutionState::NotAttempted,
    };

    if (res.timed_out) {
        LOG_DEBUG("{}: timed out after {}", ctx.group_id, language.run_timeout);
    } else if (res.signal) {
        LOG_DEBUG("{}: killed by {}", ctx.group_id, linux::Signal{*res.signal});
    } else if (res.memory_exceeded) {
        LOG_DEBUG("{}: exceeded {}KiB of memory", ctx.group_id, language.memory_limit_kb);
    } else {
        LOG_DEBUG("{}: exited with {} after {}", ctx.group_id, res.exit_code.value_or(-1), res.duration);
    }

    return res;
}

} // namespace polygrader
