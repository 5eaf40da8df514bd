#pragma once

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>

#include <string>

namespace polygrader {

inline constexpr double MIN_GRADE = 0.0;
inline constexpr double MAX_GRADE = 20.0;

struct ScoreBand
{
    double low;
    double high;
};

/// Execution score for each outcome. Must be ordered so that a better outcome never
/// scores below a worse one.
struct ScoreBands
{
    double timed_out = 5.0;

    /// Signals and memory kills score `low`, non-zero exit codes `high`
    ScoreBand crashed{.low = 5.0, .high = 8.0};

    /// Position within the band depends on runtime, relative to the language's baseline
    ScoreBand error_output{.low = 10.0, .high = 15.0};

    /// A successful run scores `success_base` plus up to `success_bonus_cap`, for speed
    double success_base = 15.0;
    double success_bonus_cap = 5.0;
};

struct GradingPolicy
{
    GradeWeights weights;
    ScoreBands bands;
};

/// Checks ``policy`` for usability. Weights that are finite and non-negative but do not sum
/// to 1 are rescaled (with a warning); anything else wrong is described in the error.
Expected<GradingPolicy, std::string> validate_policy(GradingPolicy policy);

} // namespace polygrader
