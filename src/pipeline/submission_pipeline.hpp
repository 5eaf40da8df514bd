#pragma once

#include "build/build_orchestrator.hpp"
#include "detect/language_detector.hpp"
#include "grading/grading_aggregator.hpp"
#include "grading/scorers.hpp"
#include "sandbox/execution_sandbox.hpp"
#include "toolchain/toolchain_registry.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/grading_session.hpp>

#include <filesystem>
#include <stop_token>

namespace polygrader {

struct PipelineOptions
{
    /// Workspaces are created below this directory
    std::filesystem::path work_root = std::filesystem::temp_directory_path();

    bool keep_workspaces = false;

    BuildOptions build;
    SandboxOptions sandbox;
};

/// Evaluates a single group from start to finish: detect, build, run, classify, grade.
///
/// `evaluate` is const and touches no shared mutable state, so any number of workers may
/// use one pipeline concurrently.
class SubmissionPipeline
{
public:
    /// The registry and scorers must outlive the pipeline
    SubmissionPipeline(const ToolchainRegistry& registry, PipelineOptions options, GradingPolicy policy,
                       const StaticCodeScorer& code_scorer, const DocumentationScorer& doc_scorer);

    /// Never fails: problems with the submission end up in the result's state, problems with
    /// the environment in its `system_fault`.
    GroupResult evaluate(const GroupSubmission& group, std::stop_token stop_token = {}) const;

    const GradingAggregator& aggregator() const noexcept { return aggregator_; }

private:
    /// Builds and runs in a fresh workspace, filling in ``res.build`` and ``res.execution``
    Result<void> build_and_run(const Submission& code, const Detection& detection, GroupResult& res,
                               std::stop_token stop_token) const;

    const ToolchainRegistry* registry_;
    PipelineOptions options_;

    LanguageDetector detector_;
    BuildOrchestrator builder_;
    ExecutionSandbox sandbox_;
    GradingAggregator aggregator_;

    const StaticCodeScorer* code_scorer_;
    const DocumentationScorer* doc_scorer_;
};

/// Human readable explanation of a system fault hit while handling ``language``
std::string describe_fault(ErrorKind kind, const LanguageProfile* language);

} // namespace polygrader
