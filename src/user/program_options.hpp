#pragma once

#include "output/verbosity.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/common/expected.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

struct ProgramOptions
{

    // ###### Argument fields

    /// Level of verbosity for cli output.
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    /// One directory per group; the directory name is the group id.
    /// Mutually exclusive with `manifest`.
    std::vector<std::filesystem::path> submission_dirs;

    /// CSV batch manifest. See ManifestReader for the format.
    std::optional<std::filesystem::path> manifest;

    std::optional<std::filesystem::path> config_path;

    // Overrides of configuration file values

    std::optional<std::size_t> workers;

    /// Applied to every group that does not supply its own
    std::optional<double> static_score;
    std::optional<double> doc_score;

    /// Directory holding one documentation directory per group, named after the group id
    std::optional<std::filesystem::path> doc_dir;

    // ###### Argument defaults

    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                           fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_directory(path)) {
            return (fmt::format(fmt, path.string()) + " is not a directory");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_score(std::optional<double> score, std::string_view what) {
        if (score && !(*score >= 0.0 && *score <= 20.0)) {
            return fmt::format("{} {} is outside of [0, 20]", what, *score);
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() {
        // Assume that all enumerators have valid values except for verbosity
        // which we will just clamp to [MIN, MAX]

        constexpr auto MAX_VERBOSITY = VerbosityLevel::Max;
        constexpr auto MIN_VERBOSITY = VerbosityLevel{};

        verbosity = std::clamp(verbosity, MIN_VERBOSITY, MAX_VERBOSITY);

        if (manifest && !submission_dirs.empty()) {
            return std::string{"Submission directories and --manifest are mutually exclusive"};
        }

        if (!manifest && submission_dirs.empty()) {
            return std::string{"Nothing to grade: give submission directories or --manifest"};
        }

        for (const auto& dir : submission_dirs) {
            TRY(ensure_is_directory(dir, "Submission directory {:?}"));
        }

        if (manifest) {
            TRY(ensure_is_regular_file(*manifest, "Manifest file {:?}"));
        }

        if (config_path) {
            TRY(ensure_is_regular_file(*config_path, "Configuration file {:?}"));
        }

        if (doc_dir) {
            TRY(ensure_is_directory(*doc_dir, "Documentation directory {:?}"));
        }

        if (workers && *workers == 0) {
            return std::string{"Number of workers must be positive"};
        }

        TRY(ensure_is_score(static_score, "Static code score"));
        TRY(ensure_is_score(doc_score, "Documentation score"));

        return {};
    }
};

} // namespace polygrader

template <>
struct fmt::formatter<::polygrader::ProgramOptions> : fmt::formatter<std::string_view>
{
    auto format(const ::polygrader::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{verbosity={}, color_opt={}, submission_dirs={}, manifest={}, config={}, workers={}, "
                              "static_score={}, doc_score={}, doc_dir={}}}",
                              fmt::underlying(from.verbosity), fmt::underlying(from.colorize_option),
                              from.submission_dirs, from.manifest, from.config_path, from.workers, from.static_score,
                              from.doc_score, from.doc_dir);
    }
};
