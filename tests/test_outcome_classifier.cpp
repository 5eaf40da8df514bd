#include "catch2_custom.hpp"

#include "classify/outcome_classifier.hpp"

#include <polygrader/grading_session.hpp>

#include <csignal>
#include <optional>
#include <string>
#include <utility>

using namespace polygrader;

namespace {

BuildResult built() {
    return BuildResult{.success = true, .compiled = true};
}

ExecutionResult exited(int code, std::string err = "") {
    ExecutionResult res{.exit_code = code};
    res.stderr_capture.total_bytes = err.size();
    res.stderr_capture.data = std::move(err);
    return res;
}

} // namespace

TEST_CASE("Failed builds are CompileFailed, whatever else happened") {
    const BuildResult failed{.success = false, .compiled = true};

    REQUIRE(classify_outcome(failed, std::nullopt) == ExecutionState::CompileFailed);
    REQUIRE(classify_outcome(failed, exited(0)) == ExecutionState::CompileFailed);
}

TEST_CASE("A build that was never run is NotAttempted") {
    REQUIRE(classify_outcome(built(), std::nullopt) == ExecutionState::NotAttempted);
}

TEST_CASE("Timeouts take precedence over crashes and output") {
    ExecutionResult run = exited(1, "partial output");
    run.exit_code = std::nullopt;
    run.signal = SIGKILL;
    run.timed_out = true;

    REQUIRE(classify_outcome(built(), run) == ExecutionState::TimedOut);
}

TEST_CASE("Crashes") {
    SECTION("Non-zero exit code") {
        REQUIRE(classify_outcome(built(), exited(1)) == ExecutionState::Crashed);
    }

    SECTION("Non-zero exit code with stderr") {
        REQUIRE(classify_outcome(built(), exited(2, "Traceback")) == ExecutionState::Crashed);
    }

    SECTION("Fatal signal") {
        ExecutionResult run{.exit_code = std::nullopt, .signal = SIGSEGV};
        REQUIRE(classify_outcome(built(), run) == ExecutionState::Crashed);
    }

    SECTION("Memory ceiling") {
        ExecutionResult run{.exit_code = std::nullopt, .signal = SIGKILL, .memory_exceeded = true};
        REQUIRE(classify_outcome(built(), run) == ExecutionState::Crashed);
    }
}

TEST_CASE("Clean exits are split by stderr") {
    REQUIRE(classify_outcome(built(), exited(0, "warning: deprecated")) == ExecutionState::RanWithErrorOutput);
    REQUIRE(classify_outcome(built(), exited(0)) == ExecutionState::RanSuccessfully);
}

TEST_CASE("Truncated stderr still counts as error output") {
    ExecutionResult run = exited(0);
    run.stderr_capture.truncated = true;
    run.stderr_capture.total_bytes = 1 << 20;

    REQUIRE(classify_outcome(built(), run) == ExecutionState::RanWithErrorOutput);
}

TEST_CASE("Interpreted languages are classified like compiled ones") {
    const BuildResult interpreted{.success = true, .compiled = false};

    REQUIRE(classify_outcome(interpreted, exited(0)) == ExecutionState::RanSuccessfully);
    REQUIRE(classify_outcome(interpreted, exited(1)) == ExecutionState::Crashed);
}
