#include "common/which.hpp"

#include <polygrader/logging.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include <cstdlib>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

namespace polygrader {

namespace {

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code err;
    return std::filesystem::is_regular_file(path, err) && ::access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> path_dirs() {
    const char* path_env = std::getenv("PATH");

    if (path_env == nullptr) {
        LOG_WARN("$PATH is not set; only commands given as paths can be resolved");
        return {};
    }

    return std::string_view{path_env} | ranges::views::split(':') |
           ranges::views::transform([](auto&& dir) { return dir | ranges::to<std::string>(); }) |
           ranges::to<std::vector<std::string>>();
}

} // namespace

std::optional<std::filesystem::path> which(std::string_view cmd, const std::filesystem::path& base_dir) {
    if (cmd.empty()) {
        return std::nullopt;
    }

    if (cmd.find('/') != std::string_view::npos) {
        std::filesystem::path path{cmd};
        if (path.is_relative() && !base_dir.empty()) {
            path = base_dir / path;
        }

        if (!is_executable_file(path)) {
            return std::nullopt;
        }
        return path;
    }

    static std::mutex cache_mutex;
    static std::map<std::string, std::optional<std::filesystem::path>, std::less<>> cmd_cache;
    static const std::vector<std::string> dirs = path_dirs();

    std::scoped_lock lock{cache_mutex};

    if (auto iter = cmd_cache.find(cmd); iter != cmd_cache.end()) {
        return iter->second;
    }

    std::optional<std::filesystem::path> res;

    for (const std::string& dir : dirs) {
        // An empty $PATH entry means the current directory, which we never search
        if (dir.empty()) {
            continue;
        }

        std::filesystem::path candidate = std::filesystem::path{dir} / cmd;
        if (is_executable_file(candidate)) {
            res = candidate;
            break;
        }
    }

    LOG_DEBUG("which({}) -> {}", cmd, res ? res->string() : "<not found>");

    cmd_cache.emplace(std::string{cmd}, res);

    return res;
}

} // namespace polygrader
