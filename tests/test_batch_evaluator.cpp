#include "catch2_custom.hpp"

#include "grading/grading_policy.hpp"
#include "grading/scorers.hpp"
#include "pipeline/batch_evaluator.hpp"
#include "pipeline/submission_pipeline.hpp"
#include "test_helpers.hpp"
#include "toolchain/toolchain_registry.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/grading_session.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <random>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace polygrader;
using namespace std::chrono_literals;

namespace {

/// Like the shell profile, but patient enough that only cancellation ends a long run
LanguageProfile patient_shell_profile() {
    LanguageProfile profile = test::shell_profile();
    profile.run_timeout = 60s;
    return profile;
}

struct BatchFixture
{
    ToolchainRegistry registry{std::vector{patient_shell_profile()}};
    FixedStaticCodeScorer code_scorer{10.0};
    FixedDocumentationScorer doc_scorer{10.0};
    SubmissionPipeline pipeline{registry, PipelineOptions{}, validate_policy(GradingPolicy{}).value(), code_scorer,
                                doc_scorer};
};

} // namespace

TEST_CASE("Results are attributed to their groups, in submission order") {
    const BatchFixture fixture;

    const std::size_t num_workers = GENERATE(1, 3, 16);
    const BatchEvaluator evaluator{fixture.pipeline, num_workers};

    // Earlier groups sleep longer, so workers finish out of order
    std::vector<GroupSubmission> groups;
    for (int idx = 0; idx < 10; ++idx) {
        groups.push_back(test::make_group(fmt::format("g{:02}", idx),
                                          {{"main.sh", fmt::format("sleep 0.{}\necho g{:02}", 9 - idx, idx)}}));
    }

    std::map<std::string, int> callback_counts;

    const BatchResult batch = evaluator.evaluate_all(groups, {}, [&callback_counts](const GroupResult& res) {
        ++callback_counts[res.group_id];
    });

    REQUIRE_FALSE(batch.cancelled);
    REQUIRE(batch.results.size() == groups.size());
    REQUIRE(batch.num_graded() == groups.size());
    REQUIRE(batch.num_system_faults() == 0);

    for (std::size_t idx = 0; idx < groups.size(); ++idx) {
        const GroupResult& res = batch.results[idx];

        REQUIRE(res.group_id == groups[idx].code.group_id);
        REQUIRE(res.state == ExecutionState::RanSuccessfully);
        REQUIRE(res.execution->stdout_capture.data == res.group_id + "\n");
        REQUIRE(callback_counts[res.group_id] == 1);
    }
}

TEST_CASE("Attribution holds over repeated randomized batches") {
    const BatchFixture fixture;

    std::mt19937 rng{Catch::getSeed()};
    std::uniform_int_distribution<std::size_t> group_count{1, 12};
    std::uniform_int_distribution<std::size_t> worker_count{1, 6};
    std::uniform_int_distribution<int> sleep_ms{0, 150};

    for (int round = 0; round < 5; ++round) {
        const BatchEvaluator evaluator{fixture.pipeline, worker_count(rng)};

        std::vector<GroupSubmission> groups;
        const std::size_t num_groups = group_count(rng);
        for (std::size_t idx = 0; idx < num_groups; ++idx) {
            const std::string group_id = fmt::format("r{}g{:02}", round, idx);
            groups.push_back(test::make_group(
                group_id, {{"main.sh", fmt::format("sleep 0.{:03}\necho {}", sleep_ms(rng), group_id)}}));
        }

        std::map<std::string, int> callback_counts;
        const BatchResult batch = evaluator.evaluate_all(groups, {}, [&callback_counts](const GroupResult& res) {
            ++callback_counts[res.group_id];
        });

        INFO(fmt::format("round {}: {} groups on {} workers", round, num_groups, evaluator.num_workers()));
        REQUIRE(batch.results.size() == num_groups);
        REQUIRE(batch.num_graded() == num_groups);
        REQUIRE(callback_counts.size() == num_groups);

        for (std::size_t idx = 0; idx < num_groups; ++idx) {
            const GroupResult& res = batch.results[idx];

            REQUIRE(res.group_id == groups[idx].code.group_id);
            REQUIRE(res.execution->stdout_capture.data == res.group_id + "\n");
            REQUIRE(callback_counts[res.group_id] == 1);
        }
    }
}

TEST_CASE("An empty batch evaluates nothing") {
    const BatchFixture fixture;
    const BatchEvaluator evaluator{fixture.pipeline, 4};

    const BatchResult batch = evaluator.evaluate_all({});

    REQUIRE(batch.results.empty());
    REQUIRE_FALSE(batch.cancelled);
}

TEST_CASE("One group's system fault does not affect the others") {
    const ToolchainRegistry registry{test::test_profiles()};
    const FixedStaticCodeScorer code_scorer{10.0};
    const FixedDocumentationScorer doc_scorer{10.0};
    const SubmissionPipeline pipeline{registry, PipelineOptions{}, validate_policy(GradingPolicy{}).value(),
                                      code_scorer, doc_scorer};
    const BatchEvaluator evaluator{pipeline, 2};

    const std::vector groups{
        test::make_group("ok1", {{"main.sh", "echo ok"}}),
        test::make_group("broken", {{"main.missing", "?"}}),
        test::make_group("ok2", {{"main.sh", "echo ok"}}),
    };

    const BatchResult batch = evaluator.evaluate_all(groups);

    REQUIRE(batch.num_graded() == 2);
    REQUIRE(batch.num_system_faults() == 1);
    REQUIRE(batch.results[0].graded());
    REQUIRE(batch.results[1].system_fault->kind == ErrorKind::ToolchainMissing);
    REQUIRE_FALSE(batch.results[1].graded());
    REQUIRE(batch.results[2].graded());
}

TEST_CASE("An unreadable hand-in does not hold up the other groups") {
    const BatchFixture fixture;
    const BatchEvaluator evaluator{fixture.pipeline, 2};

    std::vector groups{
        test::make_group("ok1", {{"main.sh", "echo ok"}}),
        test::make_group("gone", {}),
        test::make_group("ok2", {{"main.sh", "echo ok"}}),
    };
    groups[1].load_error = "Submission directory of group \"gone\" is not a directory";

    const BatchResult batch = evaluator.evaluate_all(groups);

    REQUIRE(batch.results.size() == 3);
    REQUIRE(batch.num_graded() == 2);
    REQUIRE(batch.results[0].state == ExecutionState::RanSuccessfully);
    REQUIRE(batch.results[1].group_id == "gone");
    REQUIRE(batch.results[1].system_fault->kind == ErrorKind::SubmissionUnavailable);
    REQUIRE_FALSE(batch.results[1].graded());
    REQUIRE(batch.results[2].state == ExecutionState::RanSuccessfully);
}

TEST_CASE("Cancellation stops every running and pending evaluation") {
    const BatchFixture fixture;
    const BatchEvaluator evaluator{fixture.pipeline, 2};

    std::vector<GroupSubmission> groups;
    for (int idx = 0; idx < 5; ++idx) {
        groups.push_back(test::make_group(fmt::format("slow{}", idx), {{"main.sh", "sleep 30"}}));
    }

    std::stop_source stop_source;
    std::jthread stopper{[&stop_source] {
        std::this_thread::sleep_for(300ms);
        stop_source.request_stop();
    }};

    int callbacks = 0;
    const auto start = std::chrono::steady_clock::now();

    const BatchResult batch =
        evaluator.evaluate_all(groups, stop_source.get_token(), [&callbacks](const GroupResult&) { ++callbacks; });

    REQUIRE(std::chrono::steady_clock::now() - start < 10s);
    REQUIRE(batch.cancelled);
    REQUIRE(batch.results.size() == groups.size());
    REQUIRE(callbacks == 5);

    for (std::size_t idx = 0; idx < groups.size(); ++idx) {
        const GroupResult& res = batch.results[idx];

        REQUIRE(res.group_id == groups[idx].code.group_id);
        REQUIRE(res.system_fault);
        REQUIRE(res.system_fault->kind == ErrorKind::Cancelled);
        REQUIRE_FALSE(res.graded());
    }
}
