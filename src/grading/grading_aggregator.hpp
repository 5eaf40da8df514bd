#pragma once

#include "grading/grading_policy.hpp"

#include <polygrader/grading_session.hpp>

#include <chrono>
#include <optional>

namespace polygrader {

/// Turns an execution outcome plus externally provided code and documentation scores
/// into a final grade.
class GradingAggregator
{
public:
    /// ``policy`` must have passed `validate_policy`
    explicit GradingAggregator(GradingPolicy policy);

    /// Score in [0, 20] for the execution component. Monotonic in ``state``.
    ///
    /// ``execution`` and ``baseline`` refine the score within a state's band; without them the
    /// lowest score of the band is used.
    double execution_score(ExecutionState state, const std::optional<ExecutionResult>& execution,
                           std::chrono::milliseconds baseline) const;

    /// Combines the three components. Component scores are clamped to [0, 20] first.
    GradeBreakdown aggregate(double code_score, double execution_score, double documentation_score) const;

    const GradingPolicy& policy() const noexcept { return policy_; }

private:
    GradingPolicy policy_;
};

} // namespace polygrader
