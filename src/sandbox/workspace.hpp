#pragma once

#include <polygrader/common/class_traits.hpp>
#include <polygrader/common/error_types.hpp>
#include <polygrader/grading_session.hpp>

#include <filesystem>
#include <string_view>

namespace polygrader {

/// A private, freshly created directory that one evaluation builds and runs in.
/// The directory and everything in it is removed on destruction, unless `keep` was called.
class Workspace : NonCopyable
{
public:
    /// Creates a new directory under ``root``, with ``label`` (sanitized) in its name
    static Result<Workspace> create(const std::filesystem::path& root, std::string_view label);

    ~Workspace();
    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& rhs) noexcept;

    /// Writes every file of ``submission`` below the workspace, creating subdirectories as needed
    Result<void> populate(const Submission& submission) const;

    const std::filesystem::path& path() const noexcept { return path_; }

    /// Leave the directory on disk after destruction
    void keep() noexcept { keep_ = true; }

private:
    explicit Workspace(std::filesystem::path path)
        : path_{std::move(path)} {}

    void remove() noexcept;

    std::filesystem::path path_;
    bool keep_ = false;
};

} // namespace polygrader
