#include "grading/grading_aggregator.hpp"

#include "grading/grading_policy.hpp"

#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <libassert/assert.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>
#include <string_view>

namespace polygrader {

namespace {

double clamp_grade(double score, std::string_view component) {
    if (!std::isfinite(score)) {
        LOG_WARN("{} score {} is not a number; using {}", component, score, MIN_GRADE);
        return MIN_GRADE;
    }

    if (score < MIN_GRADE || score > MAX_GRADE) {
        LOG_WARN("{} score {} is outside of [{}, {}]; clamping", component, score, MIN_GRADE, MAX_GRADE);
    }

    return std::clamp(score, MIN_GRADE, MAX_GRADE);
}

/// 1 for runs at or below the baseline, falling towards 0 as runs get slower
double speed_factor(const std::optional<ExecutionResult>& execution, std::chrono::milliseconds baseline) {
    if (!execution || baseline.count() <= 0) {
        return 0.0;
    }

    if (execution->duration <= baseline) {
        return 1.0;
    }

    return static_cast<double>(baseline.count()) / static_cast<double>(execution->duration.count());
}

} // namespace

GradingAggregator::GradingAggregator(GradingPolicy policy)
    : policy_{policy} {
    ASSERT(std::abs(policy_.weights.sum() - 1.0) < 1e-6, "weights must be validated first", policy_.weights.sum());
}

double GradingAggregator::execution_score(ExecutionState state, const std::optional<ExecutionResult>& execution,
                                          std::chrono::milliseconds baseline) const {
    const ScoreBands& bands = policy_.bands;

    switch (state) {
    case ExecutionState::NotAttempted:
    case ExecutionState::CompileFailed:
        return MIN_GRADE;

    case ExecutionState::TimedOut:
        return bands.timed_out;

    case ExecutionState::Crashed:
        // A program that ended itself with an error code got further than one that was killed
        if (execution && execution->exit_code && !execution->memory_exceeded) {
            return bands.crashed.high;
        }
        return bands.crashed.low;

    case ExecutionState::RanWithErrorOutput: {
        const double width = bands.error_output.high - bands.error_output.low;
        return bands.error_output.low + width * speed_factor(execution, baseline);
    }

    case ExecutionState::RanSuccessfully:
        return std::min(MAX_GRADE, bands.success_base + bands.success_bonus_cap * speed_factor(execution, baseline));
    }

    UNREACHABLE(state);
}

GradeBreakdown GradingAggregator::aggregate(double code_score, double execution_score,
                                            double documentation_score) const {
    GradeBreakdown res{
        .code_score = clamp_grade(code_score, "Code"),
        .execution_score = clamp_grade(execution_score, "Execution"),
        .documentation_score = clamp_grade(documentation_score, "Documentation"),
        .weights = policy_.weights,
        .final_grade = 0.0,
        .analysis_time = {},
    };

    const double weighted = res.weights.code * res.code_score + res.weights.execution * res.execution_score +
                            res.weights.documentation * res.documentation_score;

    res.final_grade = std::clamp(weighted, MIN_GRADE, MAX_GRADE);

    return res;
}

} // namespace polygrader
