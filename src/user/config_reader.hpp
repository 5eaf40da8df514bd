#pragma once

#include "grading/grading_policy.hpp"
#include "pipeline/submission_pipeline.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/language_profile.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

/// Limits that replace a language profile's defaults
struct LanguageOverride
{
    std::optional<std::chrono::milliseconds> run_timeout;
    std::optional<std::size_t> memory_limit_mb;
};

/// Everything an operator can tune about a grading run
struct EvaluatorConfig
{
    /// Upper bounds for timeouts and memory ceilings. Deadlines and byte counts derived from
    /// larger values would overflow.
    static constexpr std::chrono::milliseconds MAX_TIMEOUT = std::chrono::hours{24};
    static constexpr std::size_t MAX_MEMORY_LIMIT_MB = 1024 * 1024;

    std::size_t workers = 4;
    std::size_t output_cap_bytes = 64 * 1024;
    std::chrono::milliseconds compile_timeout{std::chrono::seconds{30}};

    /// Replaces the memory ceiling of every language
    std::optional<std::size_t> memory_limit_mb;

    /// Keyed by language name, as written in the configuration (case is ignored on lookup)
    std::map<std::string, LanguageOverride, std::less<>> language_overrides;

    /// Defaults to the system's temporary directory
    std::optional<std::filesystem::path> work_root;
    bool keep_workspaces = false;

    GradingPolicy policy;

    /// Verify that all fields are valid. Weights are normalized in place.
    Expected<void, std::string> validate();

    /// Applies the memory and timeout overrides to ``profiles``.
    /// Fails if an override names a language that is not among them.
    Expected<std::vector<LanguageProfile>, std::string> apply_overrides(std::vector<LanguageProfile> profiles) const;

    PipelineOptions pipeline_options() const;
};

/// Reader for evaluator configuration files
///
/// Expects `key = value` lines. Blank lines and lines starting with '#' are skipped.
/// Unknown keys and malformed values are errors, reported with their line number.
class ConfigReader
{
public:
    explicit ConfigReader(std::filesystem::path path);

    Expected<EvaluatorConfig, std::string> read() const;

    /// Parses configuration text, starting from the defaults. The result is not validated.
    static Expected<EvaluatorConfig, std::string> parse(std::string_view text);

private:
    std::filesystem::path path_;
};

} // namespace polygrader
