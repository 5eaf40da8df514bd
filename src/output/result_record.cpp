#include "output/result_record.hpp"

#include "toolchain/toolchain_registry.hpp"

#include <polygrader/common/linux.hpp>
#include <polygrader/grading_session.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polygrader {

namespace {

/// Language of a single file, including auxiliary (header) extensions
std::string file_language(const std::filesystem::path& path, const ToolchainRegistry& registry) {
    const SourceFile file{.path = path, .content = {}};
    const std::string ext = file.extension();

    if (auto profile = registry.resolve(ext)) {
        return profile->get().name;
    }

    for (const LanguageProfile& profile : registry.profiles()) {
        if (profile.has_auxiliary_extension(ext)) {
            return profile.name;
        }
    }

    return "Unknown";
}

template <typename T>
std::string optional_text(const std::optional<T>& value) {
    if (!value) {
        return "";
    }
    return fmt::format("{}", *value);
}

std::string score_text(const std::optional<double>& score) {
    if (!score) {
        return "";
    }
    return fmt::format("{:.2f}", *score);
}

} // namespace

ResultRecord ResultRecord::from(const GroupResult& result, const ToolchainRegistry& registry) {
    ResultRecord rec{.group = result.group_id};

    for (const auto& path : result.files) {
        rec.files.push_back(fmt::format("{}:{}", path.string(), file_language(path, registry)));
    }

    if (result.detection) {
        rec.language = result.detection->language().name;
        rec.entry = result.detection->entry_file.string();
    } else if (result.detection_failure) {
        rec.language = fmt::format("unresolved:{}", *result.detection_failure);
    }

    if (result.build) {
        rec.compile_success = result.build->success;
        rec.compiler_output = result.build->diagnostics();
    }

    rec.execution_state = result.state;

    if (const auto& exec = result.execution) {
        rec.exit_code = exec->exit_code;
        if (exec->signal) {
            rec.signal = fmt::format("SIG{}", linux::Signal{*exec->signal}.name());
        }
        rec.timed_out = exec->timed_out;
        rec.execution_ms = exec->duration.count();
        rec.peak_memory_kb = exec->peak_memory_kb;
        rec.stdout_text = exec->stdout_capture.data;
        rec.stdout_truncated = exec->stdout_capture.truncated;
        rec.stderr_text = exec->stderr_capture.data;
        rec.stderr_truncated = exec->stderr_capture.truncated;
    }

    if (result.system_fault) {
        rec.system_fault = fmt::format("{}: {}", result.system_fault->kind, result.system_fault->message);
    }

    if (const auto& grade = result.grade) {
        rec.code_score = grade->code_score;
        rec.execution_score = grade->execution_score;
        rec.documentation_score = grade->documentation_score;
        rec.final_grade = grade->final_grade;
    }

    return rec;
}

std::vector<std::pair<std::string_view, std::string>> ResultRecord::fields() const {
    auto bool_text = [](bool value) { return std::string{value ? "true" : "false"}; };

    return {
        {"group", group},
        {"files", fmt::format("{}", fmt::join(files, ";"))},
        {"language", language},
        {"entry", entry.value_or("")},
        {"compile_success", compile_success ? bool_text(*compile_success) : ""},
        {"execution_state", std::string{enum_name(execution_state)}},
        {"exit_code", optional_text(exit_code)},
        {"signal", signal.value_or("")},
        {"timed_out", bool_text(timed_out)},
        {"execution_ms", optional_text(execution_ms)},
        {"peak_memory_kb", optional_text(peak_memory_kb)},
        {"stdout", stdout_text},
        {"stdout_truncated", bool_text(stdout_truncated)},
        {"stderr", stderr_text},
        {"stderr_truncated", bool_text(stderr_truncated)},
        {"compiler_output", compiler_output},
        {"system_fault", system_fault.value_or("")},
        {"code_score", score_text(code_score)},
        {"execution_score", score_text(execution_score)},
        {"documentation_score", score_text(documentation_score)},
        {"final_grade", score_text(final_grade)},
    };
}

} // namespace polygrader
