#pragma once

#include "common/which.hpp"
#include "grading/grading_policy.hpp"

#include <polygrader/grading_session.hpp>
#include <polygrader/language_profile.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/// Submissions and language profiles shared by the tests.
/// The shell profiles only need /bin/sh, so the pipeline can be exercised on any Linux host.
namespace polygrader::test {

using namespace std::chrono_literals;

inline Submission make_submission(std::string group_id,
                                  std::vector<std::pair<std::string, std::string>> files) {
    Submission submission{.group_id = std::move(group_id), .files = {}};

    for (auto& [path, content] : files) {
        submission.files.push_back(SourceFile{.path = path, .content = std::move(content)});
    }

    return submission;
}

inline GroupSubmission make_group(std::string group_id, std::vector<std::pair<std::string, std::string>> files) {
    return GroupSubmission{
        .code = make_submission(std::move(group_id), std::move(files)),
        .documentation = std::nullopt,
        .static_score = std::nullopt,
        .documentation_score = std::nullopt,
        .load_error = std::nullopt,
    };
}

/// Interpreted: `/bin/sh main.sh`
inline LanguageProfile shell_profile() {
    return LanguageProfile{
        .name = "Shell",
        .model = ExecutionModel::Interpreted,
        .extensions = {".sh"},
        .auxiliary_extensions = {},
        .entry_names = {"main"},
        .entry_signature = "",
        .compile_command = std::nullopt,
        .run_command = {"/bin/sh", "{entry}"},
        .run_timeout = 2s,
        .memory_limit_kb = 0,
        .limit_address_space = false,
        .baseline_runtime = 1000ms,
    };
}

/// Natively "compiled": the entry script is copied to the build output and made executable.
/// Compilation fails when the script contains the word COMPILE_ERROR.
inline LanguageProfile shell_native_profile() {
    return LanguageProfile{
        .name = "ShellNative",
        .model = ExecutionModel::CompiledNative,
        .extensions = {".shn"},
        .auxiliary_extensions = {},
        .entry_names = {"main"},
        .entry_signature = "",
        .compile_command =
            CommandTemplate{"/bin/sh", "-c",
                            R"(if grep -q COMPILE_ERROR "$1"; then echo "$1: syntax error" >&2; exit 1; fi; )"
                            R"(cp "$1" "$2" && chmod +x "$2")",
                            "sh", "{entry}", "{output}"},
        .run_command = {"{output}"},
        .run_timeout = 2s,
        .memory_limit_kb = 0,
        .limit_address_space = false,
        .baseline_runtime = 1000ms,
    };
}

/// Like `shell_profile`, but with a runtime that does not exist
inline LanguageProfile missing_runtime_profile() {
    LanguageProfile profile = shell_profile();

    profile.name = "Missing";
    profile.extensions = {".missing"};
    profile.run_command = {"polygrader-no-such-interpreter", "{entry}"};

    return profile;
}

inline std::vector<LanguageProfile> test_profiles() {
    return {shell_profile(), shell_native_profile(), missing_runtime_profile()};
}

inline bool has_command(std::string_view cmd) {
    return which(cmd).has_value();
}

} // namespace polygrader::test
