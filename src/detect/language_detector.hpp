#pragma once

#include "toolchain/toolchain_registry.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>

#include <optional>
#include <regex>
#include <vector>

namespace polygrader {

/// Decides which language a submission is written in, and which file is its entry point.
///
/// The language with the most source files wins. A tie goes to the only tied language that
/// has a recognizable entry point; otherwise detection fails as ambiguous.
class LanguageDetector
{
public:
    explicit LanguageDetector(const ToolchainRegistry& registry);

    Expected<Detection, DetectionFailure> detect(const Submission& submission) const;

private:
    struct EntryMatch
    {
        std::size_t file_idx;

        /// Found through its name or content, rather than by being the only candidate
        bool recognized;
    };

    std::optional<EntryMatch> find_entry(std::size_t profile_idx, const Submission& submission,
                                         const std::vector<std::size_t>& file_indices) const;

    const ToolchainRegistry* registry_;

    /// Parallel to `registry_->profiles()`
    std::vector<std::optional<std::regex>> entry_signatures_;
};

} // namespace polygrader
