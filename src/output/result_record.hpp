#pragma once

#include "toolchain/toolchain_registry.hpp"

#include <polygrader/grading_session.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polygrader {

/// The flat, stable view of one group's evaluation that every exporter works from.
/// Field names and order are part of the output format; see `fields`.
struct ResultRecord
{
    std::string group;

    /// "path:language" for each file of the code submission
    std::vector<std::string> files;

    /// Detected language, or "unresolved:<reason>"
    std::string language;

    std::optional<std::string> entry;

    /// Unset when no build was attempted
    std::optional<bool> compile_success;

    ExecutionState execution_state = ExecutionState::NotAttempted;

    std::optional<int> exit_code;

    /// Signal abbreviation, e.g. "SIGSEGV"
    std::optional<std::string> signal;

    bool timed_out = false;
    std::optional<long long> execution_ms;
    std::optional<std::size_t> peak_memory_kb;

    // `stdout` and `stderr` are macros, hence the suffixes
    std::string stdout_text;
    bool stdout_truncated = false;
    std::string stderr_text;
    bool stderr_truncated = false;

    std::string compiler_output;

    /// "<ErrorKind>: <description>" when the grade was withheld
    std::optional<std::string> system_fault;

    std::optional<double> code_score;
    std::optional<double> execution_score;
    std::optional<double> documentation_score;
    std::optional<double> final_grade;

    /// Flattens ``result``. The registry names the language of each file.
    static ResultRecord from(const GroupResult& result, const ToolchainRegistry& registry);

    /// Every field as (name, text), in the stable order. Absent values are empty strings.
    std::vector<std::pair<std::string_view, std::string>> fields() const;
};

} // namespace polygrader
