#pragma once

#include <polygrader/common/error_types.hpp>
#include <polygrader/common/formatters/enum.hpp>
#include <polygrader/language_profile.hpp>

#include <range/v3/algorithm/count_if.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/// Defines data classes to store result data for the current grading session

namespace polygrader {

struct SourceFile
{
    /// Relative to the submission root. Never absolute, never escapes the root.
    std::filesystem::path path;
    std::string content;

    /// Lowercased extension with the leading dot, or empty
    std::string extension() const;
};

/// One group's code (or documentation) submission. Files are kept in a deterministic order.
struct Submission
{
    std::string group_id;
    std::vector<SourceFile> files;

    bool empty() const noexcept { return files.empty(); }
};

/// A group's complete hand-in: the code to build and run, plus an optional documentation set
struct GroupSubmission
{
    Submission code;
    std::optional<Submission> documentation;

    // Externally supplied scores; when absent, the configured scorers decide
    std::optional<double> static_score;
    std::optional<double> documentation_score;

    /// Set when the hand-in could not be read. The group is then reported with a system
    /// fault and never evaluated.
    std::optional<std::string> load_error;
};

/// Outcome of a single program execution, ordered by grading precedence
enum class ExecutionState {
    NotAttempted,       ///< nothing was run (detection failure, system fault, or cancellation)
    CompileFailed,      ///< the build step did not produce a runnable artifact
    TimedOut,           ///< the run was killed at its deadline
    Crashed,            ///< non-zero exit, fatal signal, or memory ceiling hit
    RanWithErrorOutput, ///< exited with 0 but wrote to stderr
    RanSuccessfully,    ///< exited with 0 and a clean stderr
};

POLYGRADER_ENUM_NAMES(ExecutionState, NotAttempted, CompileFailed, TimedOut, Crashed, RanWithErrorOutput,
                      RanSuccessfully);

/// Why language detection produced no usable language
enum class DetectionFailure {
    Unsupported, ///< no file has a recognized extension
    Ambiguous,   ///< several languages tie and none has an entry point
    NoEntry,     ///< the language was found, but not a file to run
};

POLYGRADER_ENUM_NAMES(DetectionFailure, Unsupported, Ambiguous, NoEntry);

struct Detection
{
    std::reference_wrapper<const LanguageProfile> profile;

    /// Relative to the submission root
    std::filesystem::path entry_file;

    /// Every file of the detected language that is handed to the toolchain, in submission order
    std::vector<std::filesystem::path> sources;

    const LanguageProfile& language() const noexcept { return profile.get(); }
};

/// Bytes captured from one output stream, bounded by a cap
struct CapturedOutput
{
    std::string data;

    /// Whether bytes past the cap were discarded
    bool truncated = false;

    /// Bytes the process wrote, including discarded ones
    std::size_t total_bytes = 0;

    bool empty() const noexcept { return total_bytes == 0; }
};

struct BuildResult
{
    bool success = false;

    /// False for languages without a compile step, in which case `success` is trivially true
    bool compiled = false;

    bool timed_out = false;

    CapturedOutput compiler_stdout;
    CapturedOutput compiler_stderr;

    std::chrono::milliseconds duration{};

    /// Absolute path of the native executable or bytecode directory, when there is one
    std::optional<std::filesystem::path> artifact;

    /// stdout and stderr of the compiler, joined for reporting
    std::string diagnostics() const;
};

struct ExecutionResult
{
    /// Only set when the process exited normally. Never set for a timed out run.
    std::optional<int> exit_code;

    /// Terminating signal, when the process was killed by one (other than our deadline kill)
    std::optional<int> signal;

    bool timed_out = false;

    /// RSS sampling saw the process above its memory ceiling
    bool memory_exceeded = false;

    std::chrono::milliseconds duration{};
    std::size_t peak_memory_kb = 0;

    CapturedOutput stdout_capture;
    CapturedOutput stderr_capture;

    ExecutionState state = ExecutionState::NotAttempted;
};

struct GradeWeights
{
    double code = 0.4;
    double execution = 0.3;
    double documentation = 0.3;

    constexpr double sum() const noexcept { return code + execution + documentation; }
};

struct GradeBreakdown
{
    double code_score = 0.0;
    double execution_score = 0.0;
    double documentation_score = 0.0;

    GradeWeights weights;

    /// Weighted sum, clamped to [0, 20]
    double final_grade = 0.0;

    /// Wall time spent on the whole evaluation of the group
    std::chrono::milliseconds analysis_time{};
};

/// A failure of the grading environment, kept apart from anything the student did
struct SystemFault
{
    ErrorKind kind;
    std::string message;
};

/// Everything known about one group after evaluation. Each field is written once by the
/// pipeline and not touched afterwards.
struct GroupResult
{
    std::string group_id;

    /// Relative paths of every file in the code submission
    std::vector<std::filesystem::path> files;

    std::optional<Detection> detection;
    std::optional<DetectionFailure> detection_failure;

    std::optional<BuildResult> build;
    std::optional<ExecutionResult> execution;

    ExecutionState state = ExecutionState::NotAttempted;

    std::optional<SystemFault> system_fault;

    /// Absent when a system fault prevents a fair grade
    std::optional<GradeBreakdown> grade;

    bool graded() const noexcept { return grade.has_value(); }
};

struct BatchResult
{
    /// One entry per submitted group, in submission order
    std::vector<GroupResult> results;

    std::chrono::milliseconds elapsed{};

    bool cancelled = false;

    std::size_t num_graded() const {
        return static_cast<std::size_t>(ranges::count_if(results, &GroupResult::graded));
    }

    std::size_t num_system_faults() const {
        return static_cast<std::size_t>(
            ranges::count_if(results, [](const GroupResult& res) { return res.system_fault.has_value(); }));
    }
};

} // namespace polygrader
