#include "catch2_custom.hpp"

#include "build/build_orchestrator.hpp"
#include "detect/language_detector.hpp"
#include "pipeline/evaluation_context.hpp"
#include "sandbox/execution_sandbox.hpp"
#include "sandbox/workspace.hpp"
#include "test_helpers.hpp"
#include "toolchain/toolchain_registry.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/grading_session.hpp>

#include <csignal>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

using namespace polygrader;
namespace fs = std::filesystem;

namespace {

/// Everything needed to build and run one submission by hand
struct Fixture
{
    explicit Fixture(Submission sub)
        : submission{std::move(sub)}
        , workspace{Workspace::create(fs::temp_directory_path(), submission.group_id).value()} {
        REQUIRE(workspace.populate(submission));

        auto detected = detector.detect(submission);
        REQUIRE(detected);
        detection.emplace(std::move(detected).value());
    }

    EvaluationContext context() const {
        return {.group_id = submission.group_id, .workdir = workspace.path(), .stop_token = {}};
    }

    Result<BuildResult> build() const { return BuildOrchestrator{BuildOptions{}}.build(submission, *detection, context()); }

    Result<ExecutionResult> run(const BuildResult& build_res) const {
        return ExecutionSandbox{SandboxOptions{.output_cap_bytes = 4096}}.run(submission, *detection, build_res,
                                                                               context());
    }

    ToolchainRegistry registry{test::test_profiles()};
    LanguageDetector detector{registry};

    Submission submission;
    Workspace workspace;
    std::optional<Detection> detection;
};

} // namespace

TEST_CASE("Interpreted languages build without running anything") {
    Fixture fixture{test::make_submission("interp", {{"main.sh", "echo hi"}})};

    auto build = fixture.build();

    REQUIRE(build);
    REQUIRE(build->success);
    REQUIRE_FALSE(build->compiled);
    REQUIRE_FALSE(build->artifact);
    REQUIRE_FALSE(fs::exists(fixture.workspace.path() / "build"));
}

TEST_CASE("Compiled languages produce an artifact in the workspace") {
    Fixture fixture{test::make_submission("native", {{"main.shn", "#!/bin/sh\necho native"}})};

    auto build = fixture.build();

    REQUIRE(build);
    REQUIRE(build->success);
    REQUIRE(build->compiled);
    REQUIRE(build->artifact == fixture.workspace.path() / "build/program");

    auto run = fixture.run(*build);

    REQUIRE(run);
    REQUIRE(run->exit_code == 0);
    REQUIRE(run->stdout_capture.data == "native\n");
    REQUIRE_FALSE(run->timed_out);
}

TEST_CASE("Rejected code is an unsuccessful build, not an error") {
    Fixture fixture{test::make_submission("broken", {{"main.shn", "#!/bin/sh\nCOMPILE_ERROR"}})};

    auto build = fixture.build();

    REQUIRE(build);
    REQUIRE_FALSE(build->success);
    REQUIRE(build->compiled);
    REQUIRE_FALSE(build->artifact);
    REQUIRE(build->diagnostics().find("syntax error") != std::string::npos);
}

TEST_CASE("Run results reflect what the program did") {
    SECTION("Exit code and stderr") {
        Fixture fixture{test::make_submission("exit", {{"main.sh", "echo warn >&2\nexit 4"}})};

        auto run = fixture.run(fixture.build().value());

        REQUIRE(run);
        REQUIRE(run->exit_code == 4);
        REQUIRE(run->stderr_capture.data == "warn\n");
    }

    SECTION("Fatal signal") {
        Fixture fixture{test::make_submission("signal", {{"main.sh", "kill -ABRT $$"}})};

        auto run = fixture.run(fixture.build().value());

        REQUIRE(run);
        REQUIRE_FALSE(run->exit_code);
        REQUIRE(run->signal == SIGABRT);
    }

    SECTION("Deadline") {
        Fixture fixture{test::make_submission("slow", {{"main.sh", "sleep 30"}})};

        auto run = fixture.run(fixture.build().value());

        REQUIRE(run);
        REQUIRE(run->timed_out);
        REQUIRE_FALSE(run->exit_code);
        REQUIRE(run->duration < std::chrono::seconds{10});
    }

    SECTION("Output cap") {
        Fixture fixture{test::make_submission("chatty", {{"main.sh", "head -c 20000 /dev/zero"}})};

        auto run = fixture.run(fixture.build().value());

        REQUIRE(run);
        REQUIRE(run->exit_code == 0);
        REQUIRE(run->stdout_capture.truncated);
        REQUIRE(run->stdout_capture.data.size() == 4096);
        REQUIRE(run->stdout_capture.total_bytes == 20000);
    }

    SECTION("Programs run inside their workspace") {
        Fixture fixture{test::make_submission("cwd", {{"main.sh", "cat data/input.txt"}, {"data/input.txt", "42"}})};

        auto run = fixture.run(fixture.build().value());

        REQUIRE(run);
        REQUIRE(run->stdout_capture.data == "42");
    }
}

TEST_CASE("A missing runtime is an environment error") {
    Fixture fixture{test::make_submission("missing", {{"main.missing", "anything"}})};

    auto build = fixture.build();
    REQUIRE(build);

    REQUIRE(fixture.run(*build) == ErrorKind::ToolchainMissing);
}
