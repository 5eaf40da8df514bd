#include "user/manifest_reader.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include <charconv>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace polygrader {

namespace {

Expected<std::optional<double>, std::string> parse_score(const std::string& field, std::string_view what) {
    if (field.empty()) {
        return std::optional<double>{};
    }

    double res{};
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), res);

    if (ec != std::errc{} || ptr != field.data() + field.size() || !std::isfinite(res)) {
        return fmt::format("{} {:?} is not a number", what, field);
    }

    if (res < 0.0 || res > 20.0) {
        return fmt::format("{} {} is outside of [0, 20]", what, res);
    }

    return std::optional<double>{res};
}

} // namespace

ManifestReader::ManifestReader(std::filesystem::path path)
    : path_{std::move(path)} {}

Expected<std::vector<ManifestEntry>, std::string> ManifestReader::read() const {
    std::ifstream in_file{path_};

    if (not in_file.is_open()) {
        return std::string{"Failed to open manifest"};
    }

    const std::filesystem::path base_dir = path_.parent_path();

    auto resolve = [&base_dir](const std::string& dir) {
        std::filesystem::path path{dir};
        return path.is_absolute() ? path : base_dir / path;
    };

    std::vector<ManifestEntry> result;

    std::string line;
    std::size_t line_num = 0;
    while (std::getline(in_file, line)) {
        ++line_num;

        // Remove a CR character; windows linefeed
        if (line.ends_with('\r')) {
            line.resize(line.size() - 1);
        }

        // Skip empty lines
        if (line.empty()) {
            LOG_INFO("Skipping empty line {} of manifest", line_num);
            continue;
        }

        std::vector values = line | ranges::views::split(',') |
                             ranges::views::transform([](auto&& rng) { return rng | ranges::to<std::string>; }) |
                             ranges::to<std::vector<std::string>>;

        if (values.size() < 2) {
            return fmt::format("Too few values in manifest entry on line {}", line_num);
        }

        if (values.size() == 4 || values.size() > 5) {
            return fmt::format("Expected 2, 3 or 5 values in manifest entry on line {}, got {}", line_num,
                               values.size());
        }

        if (values[0].empty() || values[1].empty()) {
            return fmt::format("Missing group or code directory on line {}", line_num);
        }

        ManifestEntry entry{.group_id = values[0], .code_dir = resolve(values[1])};

        if (values.size() >= 3 && !values[2].empty()) {
            entry.doc_dir = resolve(values[2]);
        }

        if (values.size() == 5) {
            auto static_score = parse_score(values[3], "Static code score");
            if (!static_score) {
                return fmt::format("{} on line {}", static_score.error(), line_num);
            }

            auto doc_score = parse_score(values[4], "Documentation score");
            if (!doc_score) {
                return fmt::format("{} on line {}", doc_score.error(), line_num);
            }

            entry.static_score = static_score.value();
            entry.doc_score = doc_score.value();
        }

        if (ranges::any_of(result, [&](const ManifestEntry& other) { return other.group_id == entry.group_id; })) {
            return fmt::format("Duplicate group {:?} on line {}", entry.group_id, line_num);
        }

        result.push_back(std::move(entry));
    }

    if (in_file.bad()) {
        return std::string{"IO error in reading"};
    }

    return result;
}

} // namespace polygrader
