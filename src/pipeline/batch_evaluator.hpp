#pragma once

#include "pipeline/submission_pipeline.hpp"

#include <polygrader/grading_session.hpp>

#include <cstddef>
#include <functional>
#include <stop_token>
#include <vector>

namespace polygrader {

/// Evaluates many groups concurrently with a fixed pool of workers pulling from a shared queue.
///
/// Each group's result is stored at that group's index, so results stay attributed to the
/// right group whatever order workers finish in.
class BatchEvaluator
{
public:
    using ResultCallback = std::function<void(const GroupResult&)>;

    /// ``pipeline`` must outlive the evaluator. ``num_workers`` must be positive.
    BatchEvaluator(const SubmissionPipeline& pipeline, std::size_t num_workers);

    /// Evaluates every group in ``groups`` and returns their results in the same order.
    ///
    /// A stop request through ``stop_token`` kills every running child process group; groups
    /// that did not finish are reported with a `Cancelled` system fault.
    /// ``on_result`` is invoked once per group, as it finishes, never concurrently with itself.
    BatchResult evaluate_all(const std::vector<GroupSubmission>& groups, std::stop_token stop_token = {},
                             const ResultCallback& on_result = {}) const;

    std::size_t num_workers() const noexcept { return num_workers_; }

private:
    const SubmissionPipeline* pipeline_;
    std::size_t num_workers_;
};

} // namespace polygrader
