#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace polygrader {

/// Resolves ``cmd`` against the directories in $PATH, like which(1).
/// Commands containing a '/' are returned as-is (made absolute against ``base_dir``)
/// when they name an executable file.
///
/// Results for bare command names are cached. Thread safe.
std::optional<std::filesystem::path> which(std::string_view cmd, const std::filesystem::path& base_dir = {});

} // namespace polygrader
