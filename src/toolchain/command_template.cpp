#include "toolchain/command_template.hpp"

#include <polygrader/common/expected.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/find.hpp>

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polygrader {

namespace {

std::optional<std::string> lookup(std::string_view name, const CommandVars& vars) {
    if (name == "entry") {
        return vars.entry;
    }
    if (name == "entry_class") {
        return vars.entry_class;
    }
    if (name == "build_dir") {
        return vars.build_dir;
    }
    if (name == "output") {
        return vars.output;
    }
    if (name == "memory_limit_mb") {
        return fmt::format("{}", vars.memory_limit_mb);
    }

    return std::nullopt;
}

/// Expands ``token`` into ``out``; returns an error message on failure
std::optional<std::string> expand_token(std::string_view token, const CommandVars& vars, std::string& out) {
    while (!token.empty()) {
        auto open = token.find('{');
        out += token.substr(0, open);

        if (open == std::string_view::npos) {
            break;
        }

        auto close = token.find('}', open);
        if (close == std::string_view::npos) {
            return fmt::format("unterminated placeholder in '{}'", token);
        }

        std::string_view name = token.substr(open + 1, close - open - 1);

        if (name == "sources") {
            return std::string{"{sources} must be a standalone argument"};
        }

        auto value = lookup(name, vars);
        if (!value) {
            return fmt::format("unknown placeholder {{{}}}", name);
        }
        out += *value;

        token.remove_prefix(close + 1);
    }

    return std::nullopt;
}

const std::regex PACKAGE_DECL{R"((?:^|\n)\s*package\s+([\w.]+)\s*;)", std::regex::ECMAScript};

} // namespace

std::string entry_class_name(const SourceFile& entry) {
    std::string name = entry.path.stem().string();

    std::smatch match;
    if (std::regex_search(entry.content, match, PACKAGE_DECL)) {
        return fmt::format("{}.{}", match[1].str(), name);
    }

    return name;
}

CommandVars make_command_vars(const Submission& submission, const Detection& detection) {
    CommandVars vars{
        .sources = {},
        .entry = detection.entry_file.string(),
        .entry_class = detection.entry_file.stem().string(),
        .build_dir = std::string{BUILD_DIR},
        .output = std::string{BUILD_OUTPUT},
        .memory_limit_mb = detection.language().memory_limit_kb / 1024,
    };

    for (const auto& source : detection.sources) {
        vars.sources.push_back(source.string());
    }

    auto entry = ranges::find(submission.files, detection.entry_file, &SourceFile::path);
    if (entry != submission.files.end()) {
        vars.entry_class = entry_class_name(*entry);
    }

    return vars;
}

Expected<std::vector<std::string>, std::string> expand_command(const CommandTemplate& templ, const CommandVars& vars) {
    std::vector<std::string> argv;

    for (const std::string& token : templ) {
        if (token == "{sources}") {
            argv.insert(argv.end(), vars.sources.begin(), vars.sources.end());
            continue;
        }

        std::string expanded;
        if (auto err = expand_token(token, vars, expanded)) {
            return std::move(*err);
        }
        argv.push_back(std::move(expanded));
    }

    if (argv.empty()) {
        return std::string{"command expands to nothing"};
    }

    return argv;
}

} // namespace polygrader
