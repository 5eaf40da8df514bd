#include "app/grader_app.hpp"

#include "app/interrupt_watcher.hpp"
#include "grading/scorers.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/result_record.hpp"
#include "output/serializer.hpp"
#include "output/stdout_sink.hpp"
#include "pipeline/batch_evaluator.hpp"
#include "pipeline/submission_pipeline.hpp"
#include "toolchain/toolchain_registry.hpp"
#include "user/config_reader.hpp"
#include "user/manifest_reader.hpp"
#include "user/program_options.hpp"
#include "user/submission_loader.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>
#include <polygrader/version.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace polygrader {

namespace {

/// Name of the last component of ``dir``, ignoring a trailing separator
std::string group_name_of(const std::filesystem::path& dir) {
    std::filesystem::path normal = dir.lexically_normal();

    if (normal.filename().empty()) {
        normal = normal.parent_path();
    }

    return normal.filename().string();
}

} // namespace

int GraderApp::run_impl() {
    StdoutSink output_sink;
    std::unique_ptr<Serializer> serializer =
        std::make_unique<PlainTextSerializer>(output_sink, OPTS.colorize_option, OPTS.verbosity);

    auto config = load_config();
    if (!config) {
        serializer->on_error(config.error());
        serializer->finalize();
        return EXIT_USAGE_ERROR;
    }

    auto profiles = config->apply_overrides(builtin_language_profiles());
    if (!profiles) {
        serializer->on_error(profiles.error());
        serializer->finalize();
        return EXIT_USAGE_ERROR;
    }

    auto groups = load_groups();
    if (!groups) {
        serializer->on_error(groups.error());
        serializer->finalize();
        return EXIT_USAGE_ERROR;
    }

    if (!OPTS.static_score) {
        LOG_WARN("No static code score given; groups without one score 0 for their code");
    }

    const ToolchainRegistry registry{std::move(profiles).value()};
    const FixedStaticCodeScorer code_scorer{OPTS.static_score.value_or(0.0)};
    const FixedDocumentationScorer doc_scorer{OPTS.doc_score.value_or(0.0)};

    const SubmissionPipeline pipeline{registry, config->pipeline_options(), config->policy, code_scorer, doc_scorer};
    const BatchEvaluator evaluator{pipeline, config->workers};

    // Must start before the evaluator creates its workers, so that they inherit the signal mask
    InterruptWatcher interrupt_watcher;
    if (auto res = interrupt_watcher.start(); !res) {
        LOG_WARN("Interrupt watcher failed to start: {}", res.error());
        serializer->on_warning("Could not install interrupt handling; Ctrl-C terminates immediately");
    }

    serializer->on_run_metadata(RunMetadata{
        .version_string = POLYGRADER_VERSION_STRING,
        .start_time = std::chrono::system_clock::now(),
        .num_groups = groups->size(),
        .num_workers = evaluator.num_workers(),
    });

    BatchResult batch = evaluator.evaluate_all(*groups, interrupt_watcher.get_token(),
                                               [&](const GroupResult& result) {
                                                   serializer->on_group_result(ResultRecord::from(result, registry));
                                               });

    serializer->on_batch_result(batch);
    serializer->finalize();

    if (batch.cancelled || batch.num_system_faults() > 0) {
        return EXIT_GRADES_WITHHELD;
    }

    return EXIT_ALL_GRADED;
}

Expected<EvaluatorConfig, std::string> GraderApp::load_config() const {
    EvaluatorConfig config;

    if (OPTS.config_path) {
        auto read_res = ConfigReader{*OPTS.config_path}.read();
        if (!read_res) {
            return read_res.error();
        }
        config = std::move(read_res).value();
    }

    if (OPTS.workers) {
        config.workers = *OPTS.workers;
    }

    if (auto valid = config.validate(); !valid) {
        return fmt::format("Invalid configuration: {}", valid.error());
    }

    return config;
}

Expected<std::vector<GroupSubmission>, std::string> GraderApp::load_groups() const {
    if (OPTS.manifest) {
        return load_groups_from_manifest();
    }

    return load_groups_from_dirs();
}

Expected<std::vector<GroupSubmission>, std::string> GraderApp::load_groups_from_manifest() const {
    ManifestReader manifest_reader{*OPTS.manifest};

    auto entries = manifest_reader.read();
    if (!entries) {
        return fmt::format("Error loading manifest {:?}: {}", OPTS.manifest->string(), entries.error());
    }

    const SubmissionLoader loader;
    std::vector<GroupSubmission> groups;
    groups.reserve(entries->size());

    for (const ManifestEntry& entry : *entries) {
        GroupSubmission group =
            loader.load_group(entry.group_id, entry.code_dir, entry.doc_dir.value_or(entry.code_dir));
        group.static_score = entry.static_score;
        group.documentation_score = entry.doc_score;

        groups.push_back(std::move(group));
    }

    return groups;
}

Expected<std::vector<GroupSubmission>, std::string> GraderApp::load_groups_from_dirs() const {
    const SubmissionLoader loader;
    std::vector<GroupSubmission> groups;
    groups.reserve(OPTS.submission_dirs.size());

    for (const std::filesystem::path& dir : OPTS.submission_dirs) {
        std::string group_id = group_name_of(dir);

        if (ranges::any_of(groups, [&](const GroupSubmission& other) { return other.code.group_id == group_id; })) {
            return fmt::format("Two submission directories are named {:?}", group_id);
        }

        // Without a documentation directory, documentation is looked for in the code itself
        std::filesystem::path doc_root = dir;
        if (OPTS.doc_dir && std::filesystem::is_directory(*OPTS.doc_dir / group_id)) {
            doc_root = *OPTS.doc_dir / group_id;
        } else if (OPTS.doc_dir) {
            LOG_WARN("No documentation directory for group {:?} in {:?}", group_id, OPTS.doc_dir->string());
        }

        groups.push_back(loader.load_group(std::move(group_id), dir, doc_root));
    }

    return groups;
}

} // namespace polygrader
