#include "detect/language_detector.hpp"

#include "toolchain/toolchain_registry.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/max.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <iterator>
#include <optional>
#include <regex>
#include <tuple>
#include <vector>

namespace polygrader {

LanguageDetector::LanguageDetector(const ToolchainRegistry& registry)
    : registry_{&registry} {
    for (const LanguageProfile& profile : registry.profiles()) {
        if (profile.entry_signature.empty()) {
            entry_signatures_.emplace_back(std::nullopt);
        } else {
            entry_signatures_.emplace_back(std::regex{profile.entry_signature, std::regex::ECMAScript});
        }
    }
}

Expected<Detection, DetectionFailure> LanguageDetector::detect(const Submission& submission) const {
    const auto& profiles = registry_->profiles();

    // Indices of each language's source files, in submission order
    std::vector<std::vector<std::size_t>> files_by_lang(profiles.size());

    for (std::size_t file_idx = 0; file_idx < submission.files.size(); ++file_idx) {
        const std::string ext = submission.files[file_idx].extension();

        for (std::size_t lang_idx = 0; lang_idx < profiles.size(); ++lang_idx) {
            if (profiles[lang_idx].has_extension(ext)) {
                files_by_lang[lang_idx].push_back(file_idx);
                break;
            }
        }
    }

    auto counts = files_by_lang | ranges::views::transform([](const auto& files) { return files.size(); }) |
                  ranges::to<std::vector<std::size_t>>();

    // Headers strengthen a language's vote, but cannot make a language appear on their own
    for (const SourceFile& file : submission.files) {
        const std::string ext = file.extension();

        for (std::size_t lang_idx = 0; lang_idx < profiles.size(); ++lang_idx) {
            if (counts[lang_idx] > 0 && profiles[lang_idx].has_auxiliary_extension(ext)) {
                ++counts[lang_idx];
                break;
            }
        }
    }
    const std::size_t max_count = counts.empty() ? 0 : ranges::max(counts);

    if (max_count == 0) {
        LOG_DEBUG("{}: no file with a supported extension among {} files", submission.group_id,
                  submission.files.size());
        return DetectionFailure::Unsupported;
    }

    std::vector<std::size_t> candidates;
    for (std::size_t lang_idx = 0; lang_idx < profiles.size(); ++lang_idx) {
        if (counts[lang_idx] == max_count) {
            candidates.push_back(lang_idx);
        }
    }

    std::optional<std::size_t> chosen;
    std::optional<EntryMatch> entry;

    if (candidates.size() == 1) {
        chosen = candidates.front();
        entry = find_entry(*chosen, submission, files_by_lang[*chosen]);
    } else {
        for (std::size_t lang_idx : candidates) {
            auto match = find_entry(lang_idx, submission, files_by_lang[lang_idx]);

            if (!match || !match->recognized) {
                continue;
            }

            if (chosen) {
                LOG_DEBUG("{}: tie between {} and {}, both with an entry point", submission.group_id,
                          profiles[*chosen].name, profiles[lang_idx].name);
                return DetectionFailure::Ambiguous;
            }

            chosen = lang_idx;
            entry = match;
        }

        if (!chosen) {
            LOG_DEBUG("{}: tie between {} languages with {} files each, none with an entry point",
                      submission.group_id, candidates.size(), max_count);
            return DetectionFailure::Ambiguous;
        }
    }

    if (!entry) {
        LOG_DEBUG("{}: detected {}, but could not tell which file to run", submission.group_id,
                  profiles[*chosen].name);
        return DetectionFailure::NoEntry;
    }

    Detection res{
        .profile = profiles[*chosen],
        .entry_file = submission.files[entry->file_idx].path,
        .sources = {},
    };

    for (std::size_t file_idx : files_by_lang[*chosen]) {
        res.sources.push_back(submission.files[file_idx].path);
    }

    LOG_DEBUG("{}: detected {} with entry point {}", submission.group_id, res.language().name,
              res.entry_file.string());

    return res;
}

std::optional<LanguageDetector::EntryMatch>
LanguageDetector::find_entry(std::size_t profile_idx, const Submission& submission,
                             const std::vector<std::size_t>& file_indices) const {
    const LanguageProfile& profile = registry_->profiles()[profile_idx];

    if (file_indices.empty()) {
        return std::nullopt;
    }

    // 1. A well-known file name. Earlier names in the profile rank higher, then shallower paths.
    std::optional<std::size_t> by_name;
    std::tuple<std::size_t, std::size_t> best_rank{};

    for (std::size_t file_idx : file_indices) {
        const auto& path = submission.files[file_idx].path;
        auto name_iter = ranges::find(profile.entry_names, path.stem().string());

        if (name_iter == profile.entry_names.end()) {
            continue;
        }

        auto depth = static_cast<std::size_t>(std::distance(path.begin(), path.end()));
        std::tuple rank{static_cast<std::size_t>(name_iter - profile.entry_names.begin()), depth};

        if (!by_name || rank < best_rank) {
            by_name = file_idx;
            best_rank = rank;
        }
    }

    if (by_name) {
        return EntryMatch{.file_idx = *by_name, .recognized = true};
    }

    // 2. Content that looks like an entry point
    if (const auto& signature = entry_signatures_[profile_idx]) {
        for (std::size_t file_idx : file_indices) {
            if (std::regex_search(submission.files[file_idx].content, *signature)) {
                return EntryMatch{.file_idx = file_idx, .recognized = true};
            }
        }
    }

    // 3. Nothing else it could be
    if (file_indices.size() == 1) {
        return EntryMatch{.file_idx = file_indices.front(), .recognized = false};
    }

    // Native builds link every source together, so the entry file is informational only
    if (profile.model == ExecutionModel::CompiledNative) {
        return EntryMatch{.file_idx = file_indices.front(), .recognized = false};
    }

    return std::nullopt;
}

} // namespace polygrader
