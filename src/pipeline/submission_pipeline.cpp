#include "pipeline/submission_pipeline.hpp"

#include "classify/outcome_classifier.hpp"
#include "pipeline/evaluation_context.hpp"
#include "sandbox/workspace.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <chrono>
#include <iterator>
#include <stop_token>
#include <string>
#include <utility>

namespace polygrader {

SubmissionPipeline::SubmissionPipeline(const ToolchainRegistry& registry, PipelineOptions options,
                                       GradingPolicy policy, const StaticCodeScorer& code_scorer,
                                       const DocumentationScorer& doc_scorer)
    : registry_{&registry}
    , options_{std::move(options)}
    , detector_{registry}
    , builder_{options_.build}
    , sandbox_{options_.sandbox}
    , aggregator_{policy}
    , code_scorer_{&code_scorer}
    , doc_scorer_{&doc_scorer} {}

GroupResult SubmissionPipeline::evaluate(const GroupSubmission& group, std::stop_token stop_token) const {
    using std::chrono::steady_clock;

    const auto start_time = steady_clock::now();
    const Submission& code = group.code;

    GroupResult res{.group_id = code.group_id};
    ranges::transform(code.files, std::back_inserter(res.files), &SourceFile::path);

    if (stop_token.stop_requested()) {
        res.system_fault =
            SystemFault{.kind = ErrorKind::Cancelled, .message = describe_fault(ErrorKind::Cancelled, nullptr)};
        return res;
    }

    if (group.load_error) {
        res.system_fault = SystemFault{.kind = ErrorKind::SubmissionUnavailable, .message = *group.load_error};
        LOG_ERROR("{}: grade withheld: {}", code.group_id, res.system_fault->message);
        return res;
    }

    LOG_DEBUG("{}: evaluating {} files", code.group_id, code.files.size());

    const double code_score = group.static_score ? *group.static_score : code_scorer_->score(code);

    const double doc_score = [&] {
        if (group.documentation_score) {
            return *group.documentation_score;
        }
        if (group.documentation) {
            return doc_scorer_->score(*group.documentation);
        }
        return doc_scorer_->score(Submission{.group_id = code.group_id, .files = {}});
    }();

    auto detection = detector_.detect(code);

    if (!detection) {
        res.detection_failure = detection.error();
        LOG_INFO("{}: language unresolved ({})", code.group_id, detection.error());
    } else {
        res.detection = detection.value();

        if (auto outcome = build_and_run(code, *res.detection, res, stop_token); !outcome) {
            res.system_fault = SystemFault{
                .kind = outcome.error(),
                .message = describe_fault(outcome.error(), &res.detection->language()),
            };
        } else {
            ASSERT(res.build.has_value());
            res.state = classify_outcome(*res.build, res.execution);

            if (res.execution) {
                res.execution->state = res.state;
            }
        }
    }

    if (res.system_fault) {
        res.build.reset();
        res.execution.reset();
        res.state = ExecutionState::NotAttempted;

        LOG_ERROR("{}: grade withheld: {}", code.group_id, res.system_fault->message);
        return res;
    }

    const auto baseline =
        res.detection ? res.detection->language().baseline_runtime : std::chrono::milliseconds::zero();

    const double exec_score = aggregator_.execution_score(res.state, res.execution, baseline);

    res.grade = aggregator_.aggregate(code_score, exec_score, doc_score);
    res.grade->analysis_time = std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - start_time);

    LOG_INFO("{}: {} -> {:.2f}/20 ({})", code.group_id, res.state, res.grade->final_grade, res.grade->analysis_time);

    return res;
}

Result<void> SubmissionPipeline::build_and_run(const Submission& code, const Detection& detection, GroupResult& res,
                                               std::stop_token stop_token) const {
    auto workspace_res = Workspace::create(options_.work_root, code.group_id);
    if (!workspace_res) {
        return workspace_res.error();
    }

    Workspace workspace = std::move(workspace_res).value();
    if (options_.keep_workspaces) {
        workspace.keep();
    }

    TRY(workspace.populate(code));

    const EvaluationContext ctx{
        .group_id = code.group_id,
        .workdir = workspace.path(),
        .stop_token = std::move(stop_token),
    };

    res.build = TRY(builder_.build(code, detection, ctx));

    if (!res.build->success) {
        LOG_DEBUG("{}: build failed, not running", code.group_id);
        return {};
    }

    res.execution = TRY(sandbox_.run(code, detection, *res.build, ctx));

    return {};
}

std::string describe_fault(ErrorKind kind, const LanguageProfile* language) {
    const std::string lang = language != nullptr ? language->name : "the submission";

    switch (kind) {
    case ErrorKind::ToolchainMissing:
        return fmt::format("the toolchain for {} is not installed on this host", lang);
    case ErrorKind::ExecFailure:
        return fmt::format("a {} toolchain process could not be started", lang);
    case ErrorKind::WorkspaceFailure:
        return "the isolated workspace could not be prepared";
    case ErrorKind::SubmissionUnavailable:
        return "the hand-in could not be read";
    case ErrorKind::Cancelled:
        return "evaluation was cancelled before it finished";
    case ErrorKind::InvalidConfig:
        return fmt::format("the command configuration for {} is invalid", lang);
    case ErrorKind::SyscallFailure:
        return "a system call failed while supervising the evaluation";
    case ErrorKind::TimedOut:
    case ErrorKind::UnknownError:
        break;
    }

    return fmt::format("internal error ({})", kind);
}

} // namespace polygrader
