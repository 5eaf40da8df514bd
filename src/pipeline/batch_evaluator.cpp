#include "pipeline/batch_evaluator.hpp"

#include "pipeline/submission_pipeline.hpp"
#include "pipeline/work_queue.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <libassert/assert.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <iterator>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace polygrader {

namespace {

GroupResult make_faulted(const GroupSubmission& group, ErrorKind kind, std::string message) {
    GroupResult res{.group_id = group.code.group_id};
    ranges::transform(group.code.files, std::back_inserter(res.files), &SourceFile::path);
    res.system_fault = SystemFault{.kind = kind, .message = std::move(message)};

    return res;
}

} // namespace

BatchEvaluator::BatchEvaluator(const SubmissionPipeline& pipeline, std::size_t num_workers)
    : pipeline_{&pipeline}
    , num_workers_{num_workers} {
    ASSERT(num_workers_ > 0);
}

BatchResult BatchEvaluator::evaluate_all(const std::vector<GroupSubmission>& groups, std::stop_token stop_token,
                                         const ResultCallback& on_result) const {
    const auto start_time = std::chrono::steady_clock::now();

    WorkQueue<std::size_t> pending;
    for (std::size_t idx = 0; idx < groups.size(); ++idx) {
        pending.push(idx);
    }

    // One slot per group, each written by exactly one worker
    std::vector<std::optional<GroupResult>> slots(groups.size());
    std::mutex callback_mutex;

    auto worker = [&](std::size_t worker_id) {
        while (auto idx = pending.try_pop()) {
            const GroupSubmission& group = groups[*idx];

            LOG_DEBUG("Worker {} takes group {} ({})", worker_id, *idx, group.code.group_id);

            GroupResult res;

            // A failure in one group must never take down the others
            try {
                res = pipeline_->evaluate(group, stop_token);
            } catch (const std::exception& ex) {
                LOG_ERROR("Evaluation of {} threw: {}", group.code.group_id, ex.what());
                res = make_faulted(group, ErrorKind::UnknownError, fmt::format("internal error: {}", ex.what()));
            }

            ASSERT(res.group_id == group.code.group_id, "result attributed to the wrong group");

            slots[*idx] = std::move(res);

            if (on_result) {
                std::scoped_lock lock{callback_mutex};
                on_result(*slots[*idx]);
            }
        }
    };

    const std::size_t num_threads = std::min(num_workers_, groups.size());

    LOG_INFO("Evaluating {} groups with {} workers", groups.size(), num_threads);

    {
        std::vector<std::jthread> workers;
        workers.reserve(num_threads);

        for (std::size_t worker_id = 0; worker_id < num_threads; ++worker_id) {
            workers.emplace_back(worker, worker_id);
        }
        // jthreads join here
    }

    BatchResult res;
    res.cancelled = stop_token.stop_requested();
    res.results.reserve(groups.size());

    for (std::size_t idx = 0; idx < groups.size(); ++idx) {
        ASSERT(slots[idx].has_value(), "every group is evaluated exactly once", idx);
        res.results.push_back(std::move(*slots[idx]));
    }

    res.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);

    LOG_INFO("Evaluated {} groups in {} ({} graded, {} system faults)", res.results.size(), res.elapsed,
             res.num_graded(), res.num_system_faults());

    return res;
}

} // namespace polygrader
