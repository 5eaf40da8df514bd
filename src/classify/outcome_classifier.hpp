#pragma once

#include <polygrader/grading_session.hpp>

#include <optional>

namespace polygrader {

/// Maps the results of a build and (optional) run to exactly one `ExecutionState`.
///
/// Precedence: CompileFailed > TimedOut > Crashed > RanWithErrorOutput > RanSuccessfully.
/// A successful build that was never run is NotAttempted.
ExecutionState classify_outcome(const BuildResult& build, const std::optional<ExecutionResult>& execution) noexcept;

} // namespace polygrader
