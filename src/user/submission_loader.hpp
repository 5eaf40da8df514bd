#pragma once

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

/// Reads a group's hand-in from a local directory tree into a `Submission`.
///
/// Hidden entries (names starting with '.') are skipped, along with everything below them.
/// Files are ordered by path, so loading the same tree always yields the same submission.
class SubmissionLoader
{
public:
    static constexpr int DEFAULT_SEARCH_DEPTH = 10;
    static constexpr std::size_t DEFAULT_MAX_FILE_BYTES = 4 * 1024 * 1024;

    /// Extensions a documentation submission is restricted to
    static constexpr std::string_view DOCUMENTATION_EXTENSIONS[] = {".md", ".txt", ".rst", ".adoc"};

    explicit SubmissionLoader(int max_depth = DEFAULT_SEARCH_DEPTH,
                              std::size_t max_file_bytes = DEFAULT_MAX_FILE_BYTES);

    /// Every regular file below ``root``
    Expected<Submission, std::string> load(std::string group_id, const std::filesystem::path& root) const;

    /// Only the documentation files below ``root``
    Expected<Submission, std::string> load_documentation(std::string group_id,
                                                         const std::filesystem::path& root) const;

    /// The code below ``code_dir`` and the documentation below ``doc_dir``. Never fails: when
    /// either cannot be read, the group carries the reason in `load_error` so that it can be
    /// reported without holding up the other groups.
    GroupSubmission load_group(std::string group_id, const std::filesystem::path& code_dir,
                               const std::filesystem::path& doc_dir) const;

private:
    Expected<Submission, std::string> load_filtered(std::string group_id, const std::filesystem::path& root,
                                                    bool documentation_only) const;

    static bool is_documentation_file(const std::filesystem::path& path);

    int max_depth_;
    std::size_t max_file_bytes_;
};

} // namespace polygrader
