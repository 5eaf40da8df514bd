#pragma once

#include "pipeline/evaluation_context.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/grading_session.hpp>

#include <chrono>
#include <cstddef>

namespace polygrader {

struct BuildOptions
{
    std::chrono::milliseconds compile_timeout{std::chrono::seconds{30}};
    std::size_t output_cap_bytes = 64 * 1024;
};

/// Turns a detected submission into something runnable.
///
/// Languages without a compile step always build successfully, without running anything.
/// A compiler that rejects the code, or is still running at the compile timeout, produces an
/// unsuccessful `BuildResult`; only environment problems (e.g. a missing compiler) are errors.
class BuildOrchestrator
{
public:
    explicit BuildOrchestrator(BuildOptions options)
        : options_{options} {}

    Result<BuildResult> build(const Submission& submission, const Detection& detection,
                              const EvaluationContext& ctx) const;

private:
    BuildOptions options_;
};

} // namespace polygrader
