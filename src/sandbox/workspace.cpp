#include "sandbox/workspace.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/common/linux.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <range/v3/algorithm/replace_if.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace polygrader {

Result<Workspace> Workspace::create(const std::filesystem::path& root, std::string_view label) {
    std::string safe_label{label.substr(0, 64)};
    ranges::replace_if(
        safe_label, [](unsigned char chr) { return !std::isalnum(chr) && chr != '-' && chr != '_'; }, '_');

    std::error_code err;
    std::filesystem::create_directories(root, err);
    if (err) {
        LOG_ERROR("Could not create workspace root {}: {}", root.string(), err.message());
        return ErrorKind::WorkspaceFailure;
    }

    auto dir = linux::mkdtemp((root / fmt::format("polygrader-{}-XXXXXX", safe_label)).string());
    if (!dir) {
        LOG_ERROR("Could not create a workspace under {}: {}", root.string(), dir.error().message());
        return ErrorKind::WorkspaceFailure;
    }

    LOG_DEBUG("Created workspace {}", dir.value());

    return Workspace{std::filesystem::path{dir.value()}};
}

Workspace::~Workspace() {
    remove();
}

Workspace::Workspace(Workspace&& other) noexcept
    : path_{std::exchange(other.path_, {})}
    , keep_{other.keep_} {}

Workspace& Workspace::operator=(Workspace&& rhs) noexcept {
    if (this != &rhs) {
        remove();
        path_ = std::exchange(rhs.path_, {});
        keep_ = rhs.keep_;
    }

    return *this;
}

Result<void> Workspace::populate(const Submission& submission) const {
    for (const SourceFile& file : submission.files) {
        // Submission paths are relative and normalized by the loader; refuse anything else here
        // so that nothing is ever written outside of the workspace
        if (file.path.is_absolute() || file.path.lexically_normal().string().starts_with("..")) {
            LOG_ERROR("Refusing to write {} outside of workspace {}", file.path.string(), path_.string());
            return ErrorKind::WorkspaceFailure;
        }

        const auto target = path_ / file.path;

        std::error_code err;
        std::filesystem::create_directories(target.parent_path(), err);
        if (err) {
            LOG_ERROR("Could not create {}: {}", target.parent_path().string(), err.message());
            return ErrorKind::WorkspaceFailure;
        }

        std::ofstream out{target, std::ios::binary | std::ios::trunc};
        out.write(file.content.data(), static_cast<std::streamsize>(file.content.size()));

        if (!out) {
            LOG_ERROR("Could not write {}", target.string());
            return ErrorKind::WorkspaceFailure;
        }
    }

    return {};
}

void Workspace::remove() noexcept {
    if (path_.empty()) {
        return;
    }

    if (keep_) {
        LOG_INFO("Keeping workspace {}", path_.string());
        return;
    }

    std::error_code err;
    std::filesystem::remove_all(path_, err);

    if (err) {
        LOG_WARN("Failed to remove workspace {}: {}", path_.string(), err.message());
    }

    path_.clear();
}

} // namespace polygrader
