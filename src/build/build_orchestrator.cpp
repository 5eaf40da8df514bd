#include "build/build_orchestrator.hpp"

#include "common/which.hpp"
#include "subprocess/run_result.hpp"
#include "subprocess/subprocess.hpp"
#include "toolchain/command_template.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <system_error>

namespace polygrader {

Result<BuildResult> BuildOrchestrator::build(const Submission& submission, const Detection& detection,
                                             const EvaluationContext& ctx) const {
    const LanguageProfile& language = detection.language();

    if (!language.needs_compile()) {
        return BuildResult{.success = true, .compiled = false};
    }

    const auto vars = make_command_vars(submission, detection);

    auto argv = expand_command(*language.compile_command, vars);
    if (!argv) {
        LOG_ERROR("Bad compile command for {}: {}", language.name, argv.error());
        return ErrorKind::InvalidConfig;
    }

    std::error_code err;
    std::filesystem::create_directories(ctx.workdir / BUILD_DIR, err);
    if (err) {
        LOG_ERROR("{}: could not create build directory: {}", ctx.group_id, err.message());
        return ErrorKind::WorkspaceFailure;
    }

    const auto compiler = which(argv->front(), ctx.workdir);
    if (!compiler) {
        LOG_ERROR("Compiler '{}' for {} not found on $PATH", argv->front(), language.name);
        return ErrorKind::ToolchainMissing;
    }

    LOG_DEBUG("{}: compiling {} sources", ctx.group_id, vars.sources.size());

    Subprocess compiler_proc{*compiler, std::move(argv).value(), ctx.workdir};

    TRY(compiler_proc.start(ProcessLimits{
        .wall_timeout = options_.compile_timeout,
        .memory_limit_kb = 0,
        .limit_address_space = false,
        .output_cap_bytes = options_.output_cap_bytes,
    }));

    const RunResult run = TRY(compiler_proc.wait_for_exit(ctx.stop_token));

    BuildResult res{
        .success = false,
        .compiled = true,
        .timed_out = run.get_kind() == RunResult::Kind::TimedOut,
        .compiler_stdout = compiler_proc.get_stdout(),
        .compiler_stderr = compiler_proc.get_stderr(),
        .duration = run.get_usage().wall_time,
        .artifact = std::nullopt,
    };

    if (res.timed_out) {
        res.compiler_stderr.data +=
            fmt::format("\nCompilation timed out ({})", std::chrono::duration_cast<std::chrono::seconds>(
                                                           options_.compile_timeout));
        return res;
    }

    if (run.get_exit_code() != 0) {
        LOG_DEBUG("{}: compiler failed ({})", ctx.group_id,
                  run.get_exit_code() ? fmt::format("exit code {}", *run.get_exit_code()) : "killed by a signal");
        return res;
    }

    const auto artifact = language.model == ExecutionModel::CompiledNative ? ctx.workdir / BUILD_OUTPUT
                                                                           : ctx.workdir / BUILD_DIR;

    if (!std::filesystem::exists(artifact, err)) {
        LOG_WARN("{}: compiler succeeded, but produced no {}", ctx.group_id, artifact.string());
        res.compiler_stderr.data += fmt::format("\nNo build output at {}", artifact.filename().string());
        return res;
    }

    res.success = true;
    res.artifact = artifact;

    return res;
}

} // namespace polygrader
