#pragma once

namespace polygrader {

/// How much the CLI prints to stdout
enum class VerbosityLevel {
    Silent,  ///< nothing; only the exit status tells the outcome
    Quiet,   ///< one line per group with its state and grade
    Summary, ///< the result record of each group, without captured output, and a batch summary
    All,     ///< adds captured stdout, stderr and compiler diagnostics
    Extra,   ///< adds the file list of each group
    Max      ///< sentinel
};

constexpr bool should_output_group_line(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level == Quiet;
}

constexpr bool should_output_record(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

constexpr bool should_output_captured_output(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= All;
}

constexpr bool should_output_file_list(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Extra;
}

constexpr bool should_output_batch_summary(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

constexpr bool should_output_run_metadata(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level > Quiet;
}

} // namespace polygrader
