#include "user/submission_loader.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace polygrader {

SubmissionLoader::SubmissionLoader(int max_depth, std::size_t max_file_bytes)
    : max_depth_{max_depth}
    , max_file_bytes_{max_file_bytes} {}

Expected<Submission, std::string> SubmissionLoader::load(std::string group_id,
                                                         const std::filesystem::path& root) const {
    return load_filtered(std::move(group_id), root, false);
}

Expected<Submission, std::string> SubmissionLoader::load_documentation(std::string group_id,
                                                                       const std::filesystem::path& root) const {
    return load_filtered(std::move(group_id), root, true);
}

GroupSubmission SubmissionLoader::load_group(std::string group_id, const std::filesystem::path& code_dir,
                                            const std::filesystem::path& doc_dir) const {
    GroupSubmission group{
        .code = Submission{.group_id = group_id, .files = {}},
        .documentation = std::nullopt,
        .static_score = std::nullopt,
        .documentation_score = std::nullopt,
        .load_error = std::nullopt,
    };

    auto code = load(group_id, code_dir);
    if (!code) {
        LOG_ERROR("{}", code.error());
        group.load_error = code.error();
        return group;
    }
    group.code = std::move(code).value();

    auto documentation = load_documentation(group_id, doc_dir);
    if (!documentation) {
        LOG_ERROR("{}", documentation.error());
        group.load_error = documentation.error();
        return group;
    }
    group.documentation = std::move(documentation).value();

    return group;
}

Expected<Submission, std::string> SubmissionLoader::load_filtered(std::string group_id,
                                                                  const std::filesystem::path& root,
                                                                  bool documentation_only) const {
    namespace fs = std::filesystem;

    std::error_code err;

    if (!fs::is_directory(root, err)) {
        return fmt::format("Submission directory {:?} of group {:?} is not a directory", root.string(), group_id);
    }

    std::vector<fs::path> paths;

    auto iter = fs::recursive_directory_iterator{root, err};
    for (; !err && iter != fs::recursive_directory_iterator{}; iter.increment(err)) {
        const fs::path& path = iter->path();

        // Entry queries may fail (e.g. on dangling symlinks) without ending the walk
        std::error_code entry_err;

        if (path.filename().string().starts_with('.')) {
            if (iter->is_directory(entry_err)) {
                iter.disable_recursion_pending();
            }
            continue;
        }

        if (iter->is_directory(entry_err) && iter.depth() >= max_depth_) {
            LOG_WARN("Not descending into {:?} of group {:?}: deeper than {} levels", path.string(), group_id,
                     max_depth_);
            iter.disable_recursion_pending();
            continue;
        }

        // Symlinks are not followed; they could point outside of the submission
        if (iter->is_symlink(entry_err) || !iter->is_regular_file(entry_err)) {
            continue;
        }

        if (documentation_only && !is_documentation_file(path)) {
            LOG_DEBUG("Skipping non-documentation file {:?}", path.string());
            continue;
        }

        paths.push_back(path.lexically_relative(root));
    }

    if (err) {
        return fmt::format("Error reading submission directory {:?}: {}", root.string(), err.message());
    }

    ranges::sort(paths);

    Submission submission{.group_id = std::move(group_id), .files = {}};
    submission.files.reserve(paths.size());

    for (fs::path& rel_path : paths) {
        const fs::path full_path = root / rel_path;

        auto size = fs::file_size(full_path, err);
        if (err) {
            return fmt::format("Could not stat {:?}: {}", full_path.string(), err.message());
        }

        if (size > max_file_bytes_) {
            LOG_WARN("Skipping {:?} of group {:?}: {} bytes exceeds the {} byte limit", full_path.string(),
                     submission.group_id, size, max_file_bytes_);
            continue;
        }

        std::ifstream in_file{full_path, std::ios::binary};
        if (not in_file.is_open()) {
            return fmt::format("Failed to open {:?}", full_path.string());
        }

        std::string content{std::istreambuf_iterator<char>{in_file}, std::istreambuf_iterator<char>{}};

        if (in_file.bad()) {
            return fmt::format("IO error in reading {:?}", full_path.string());
        }

        submission.files.push_back(SourceFile{.path = std::move(rel_path), .content = std::move(content)});
    }

    LOG_DEBUG("Loaded {} files for group {:?} from {:?}", submission.files.size(), submission.group_id,
              root.string());

    return submission;
}

bool SubmissionLoader::is_documentation_file(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    ranges::transform(ext, ext.begin(), [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });

    return ranges::any_of(DOCUMENTATION_EXTENSIONS, [&ext](std::string_view candidate) { return candidate == ext; });
}

} // namespace polygrader
