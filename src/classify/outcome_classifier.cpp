#include "classify/outcome_classifier.hpp"

#include <polygrader/grading_session.hpp>

#include <optional>

namespace polygrader {

ExecutionState classify_outcome(const BuildResult& build, const std::optional<ExecutionResult>& execution) noexcept {
    if (!build.success) {
        return ExecutionState::CompileFailed;
    }

    if (!execution) {
        return ExecutionState::NotAttempted;
    }

    if (execution->timed_out) {
        return ExecutionState::TimedOut;
    }

    if (execution->memory_exceeded || execution->signal || execution->exit_code != 0) {
        return ExecutionState::Crashed;
    }

    if (!execution->stderr_capture.empty()) {
        return ExecutionState::RanWithErrorOutput;
    }

    return ExecutionState::RanSuccessfully;
}

} // namespace polygrader
