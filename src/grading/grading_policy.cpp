#include "grading/grading_policy.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>

#include <cmath>
#include <string>

namespace polygrader {

namespace {

constexpr double WEIGHT_EPSILON = 1e-9;

bool in_grade_range(double value) {
    return std::isfinite(value) && value >= MIN_GRADE && value <= MAX_GRADE;
}

} // namespace

Expected<GradingPolicy, std::string> validate_policy(GradingPolicy policy) {
    GradeWeights& weights = policy.weights;

    for (double weight : {weights.code, weights.execution, weights.documentation}) {
        if (!std::isfinite(weight) || weight < 0.0) {
            return fmt::format("weights must be finite and non-negative (got {}/{}/{})", weights.code,
                               weights.execution, weights.documentation);
        }
    }

    const double sum = weights.sum();

    if (sum <= WEIGHT_EPSILON) {
        return std::string{"at least one weight must be positive"};
    }

    if (std::abs(sum - 1.0) > WEIGHT_EPSILON) {
        LOG_WARN("Weights {}/{}/{} sum to {}, not 1; normalizing", weights.code, weights.execution,
                 weights.documentation, sum);
        weights.code /= sum;
        weights.execution /= sum;
        weights.documentation /= sum;
    }

    const ScoreBands& bands = policy.bands;

    for (double score : {bands.timed_out, bands.crashed.low, bands.crashed.high, bands.error_output.low,
                         bands.error_output.high, bands.success_base, bands.success_base + bands.success_bonus_cap}) {
        if (!in_grade_range(score)) {
            return fmt::format("score {} is outside of [{}, {}]", score, MIN_GRADE, MAX_GRADE);
        }
    }

    if (bands.success_bonus_cap < 0.0) {
        return std::string{"the success bonus cannot be negative"};
    }

    // Better outcomes may never score below worse ones
    const bool ordered = bands.timed_out <= bands.crashed.low && bands.crashed.low <= bands.crashed.high &&
                         bands.crashed.high <= bands.error_output.low &&
                         bands.error_output.low <= bands.error_output.high &&
                         bands.error_output.high <= bands.success_base;

    if (!ordered) {
        return std::string{"score bands must not decrease from timed out, over crashed and error output, to success"};
    }

    return policy;
}

} // namespace polygrader
