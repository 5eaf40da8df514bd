#pragma once

#include <polygrader/common/expected.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace polygrader {

struct ManifestEntry
{
    std::string group_id;
    std::filesystem::path code_dir;
    std::optional<std::filesystem::path> doc_dir;

    std::optional<double> static_score;
    std::optional<double> doc_score;
};

/// Small CSV reader implementation for batch manifests
/// Expects the specified file to contain newline-separated
/// "group,code_dir[,doc_dir[,static_score,doc_score]]" entries, utf-8 encoded.
/// Empty fields are treated as absent. Relative directories are relative to the manifest.
class ManifestReader
{
public:
    explicit ManifestReader(std::filesystem::path path);

    Expected<std::vector<ManifestEntry>, std::string> read() const;

private:
    std::filesystem::path path_;
};

} // namespace polygrader
