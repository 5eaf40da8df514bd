#include "catch2_custom.hpp"

#include "output/result_record.hpp"
#include "test_helpers.hpp"
#include "toolchain/toolchain_registry.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/grading_session.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <csignal>
#include <map>
#include <string>
#include <string_view>
#include <vector>

using namespace polygrader;
using namespace std::chrono_literals;

namespace {

const ToolchainRegistry& registry() {
    static const ToolchainRegistry instance = ToolchainRegistry::with_builtin_languages();
    return instance;
}

std::map<std::string, std::string, std::less<>> field_map(const ResultRecord& rec) {
    std::map<std::string, std::string, std::less<>> res;
    for (const auto& [name, value] : rec.fields()) {
        res.emplace(name, value);
    }
    return res;
}

/// A C submission that built and ran cleanly
GroupResult graded_result() {
    const LanguageProfile& c_lang = registry().find("C")->get();

    GroupResult res{.group_id = "g07", .files = {"main.c", "util.h", "README.md"}};
    res.detection = Detection{.profile = c_lang, .entry_file = "main.c", .sources = {"main.c"}};
    res.build = BuildResult{.success = true, .compiled = true};
    res.build->compiler_stderr.data = "main.c:3: warning: unused variable";
    res.execution = ExecutionResult{
        .exit_code = 0,
        .signal = std::nullopt,
        .timed_out = false,
        .memory_exceeded = false,
        .duration = 123ms,
        .peak_memory_kb = 2048,
        .stdout_capture = {.data = "hello\n", .truncated = false, .total_bytes = 6},
        .stderr_capture = {},
        .state = ExecutionState::RanSuccessfully,
    };
    res.state = ExecutionState::RanSuccessfully;
    res.grade = GradeBreakdown{
        .code_score = 12.0, .execution_score = 20.0, .documentation_score = 15.5, .final_grade = 15.45};

    return res;
}

} // namespace

TEST_CASE("Field names and order are stable") {
    const ResultRecord rec = ResultRecord::from(graded_result(), registry());

    const auto names = rec.fields() |
                       ranges::views::transform([](const auto& field) { return std::string{field.first}; }) |
                       ranges::to<std::vector<std::string>>();

    REQUIRE(names == std::vector<std::string>{
                         "group",          "files",           "language",         "entry",
                         "compile_success", "execution_state", "exit_code",        "signal",
                         "timed_out",      "execution_ms",    "peak_memory_kb",   "stdout",
                         "stdout_truncated", "stderr",        "stderr_truncated", "compiler_output",
                         "system_fault",   "code_score",      "execution_score",  "documentation_score",
                         "final_grade",
                     });
}

TEST_CASE("Graded results are flattened") {
    const auto fields = field_map(ResultRecord::from(graded_result(), registry()));

    REQUIRE(fields.at("group") == "g07");
    REQUIRE(fields.at("files") == "main.c:C;util.h:C;README.md:Unknown");
    REQUIRE(fields.at("language") == "C");
    REQUIRE(fields.at("entry") == "main.c");
    REQUIRE(fields.at("compile_success") == "true");
    REQUIRE(fields.at("execution_state") == "RanSuccessfully");
    REQUIRE(fields.at("exit_code") == "0");
    REQUIRE(fields.at("signal").empty());
    REQUIRE(fields.at("timed_out") == "false");
    REQUIRE(fields.at("execution_ms") == "123");
    REQUIRE(fields.at("peak_memory_kb") == "2048");
    REQUIRE(fields.at("stdout") == "hello\n");
    REQUIRE(fields.at("compiler_output").find("unused variable") != std::string::npos);
    REQUIRE(fields.at("system_fault").empty());
    REQUIRE(fields.at("code_score") == "12.00");
    REQUIRE(fields.at("documentation_score") == "15.50");
    REQUIRE(fields.at("final_grade") == "15.45");
}

TEST_CASE("Signals are named") {
    GroupResult res = graded_result();
    res.execution->exit_code = std::nullopt;
    res.execution->signal = SIGSEGV;
    res.state = ExecutionState::Crashed;

    const ResultRecord rec = ResultRecord::from(res, registry());

    REQUIRE(rec.signal == "SIGSEGV");
    REQUIRE_FALSE(rec.exit_code);
    REQUIRE(rec.execution_state == ExecutionState::Crashed);
}

TEST_CASE("Withheld grades leave every score empty") {
    GroupResult res{.group_id = "g02", .files = {"Main.java"}};
    res.detection = Detection{.profile = registry().find("Java")->get(), .entry_file = "Main.java", .sources = {}};
    res.system_fault = SystemFault{.kind = ErrorKind::ToolchainMissing, .message = "javac is not installed"};

    const ResultRecord rec = ResultRecord::from(res, registry());
    const auto fields = field_map(rec);

    REQUIRE(rec.system_fault == "ToolchainMissing: javac is not installed");
    REQUIRE(fields.at("compile_success").empty());
    REQUIRE(fields.at("execution_state") == "NotAttempted");
    for (std::string_view score : {"code_score", "execution_score", "documentation_score", "final_grade"}) {
        REQUIRE(fields.find(score)->second.empty());
    }
}

TEST_CASE("Unresolved languages carry their reason") {
    GroupResult res{.group_id = "g03", .files = {"notes.txt"}};
    res.detection_failure = DetectionFailure::Unsupported;
    res.grade = GradeBreakdown{};

    const ResultRecord rec = ResultRecord::from(res, registry());

    REQUIRE(rec.language == "unresolved:Unsupported");
    REQUIRE_FALSE(rec.entry);
    REQUIRE(rec.final_grade == 0.0);
}
