#include "toolchain/toolchain_registry.hpp"

#include <polygrader/language_profile.hpp>
#include <polygrader/logging.hpp>

#include <libassert/assert.hpp>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <cctype>
#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polygrader {

using namespace std::chrono_literals;

namespace {

constexpr std::size_t MB = 1024; // in KiB

constexpr auto DEFAULT_RUN_TIMEOUT = 10s;

const char* const C_MAIN_SIGNATURE = R"(\bint\s+main\s*\()";

} // namespace

std::vector<LanguageProfile> builtin_language_profiles() {
    std::vector<LanguageProfile> profiles;

    profiles.push_back(LanguageProfile{
        .name = "C",
        .model = ExecutionModel::CompiledNative,
        .extensions = {".c"},
        .auxiliary_extensions = {".h"},
        .entry_names = {"main"},
        .entry_signature = C_MAIN_SIGNATURE,
        .compile_command = CommandTemplate{"gcc", "-O2", "-o", "{output}", "{sources}", "-lm"},
        .run_command = {"{output}"},
        .run_timeout = DEFAULT_RUN_TIMEOUT,
        .memory_limit_kb = 256 * MB,
        .limit_address_space = true,
        .baseline_runtime = 250ms,
    });

    profiles.push_back(LanguageProfile{
        .name = "C++",
        .model = ExecutionModel::CompiledNative,
        .extensions = {".cpp", ".cc", ".cxx"},
        .auxiliary_extensions = {".hpp", ".hh", ".hxx"},
        .entry_names = {"main"},
        .entry_signature = C_MAIN_SIGNATURE,
        .compile_command = CommandTemplate{"g++", "-O2", "-std=c++17", "-o", "{output}", "{sources}"},
        .run_command = {"{output}"},
        .run_timeout = DEFAULT_RUN_TIMEOUT,
        .memory_limit_kb = 256 * MB,
        .limit_address_space = true,
        .baseline_runtime = 250ms,
    });

    profiles.push_back(LanguageProfile{
        .name = "Java",
        .model = ExecutionModel::CompiledBytecode,
        .extensions = {".java"},
        .auxiliary_extensions = {},
        .entry_names = {"Main"},
        .entry_signature = R"(public\s+static\s+void\s+main\s*\()",
        .compile_command = CommandTemplate{"javac", "-encoding", "UTF-8", "-d", "{build_dir}", "{sources}"},
        .run_command = {"java", "-Xmx{memory_limit_mb}m", "-cp", "{build_dir}", "{entry_class}"},
        .run_timeout = DEFAULT_RUN_TIMEOUT,
        .memory_limit_kb = 512 * MB,
        .limit_address_space = false,
        .baseline_runtime = 1500ms,
    });

    profiles.push_back(LanguageProfile{
        .name = "Python",
        .model = ExecutionModel::Interpreted,
        .extensions = {".py"},
        .auxiliary_extensions = {},
        .entry_names = {"main", "__main__", "app"},
        .entry_signature = R"(if\s+__name__\s*==\s*['"]__main__['"])",
        .compile_command = std::nullopt,
        .run_command = {"python3", "{entry}"},
        .run_timeout = DEFAULT_RUN_TIMEOUT,
        .memory_limit_kb = 256 * MB,
        .limit_address_space = true,
        .baseline_runtime = 1000ms,
    });

    profiles.push_back(LanguageProfile{
        .name = "JavaScript",
        .model = ExecutionModel::Interpreted,
        .extensions = {".js"},
        .auxiliary_extensions = {},
        .entry_names = {"main", "index", "app"},
        .entry_signature = "",
        .compile_command = std::nullopt,
        .run_command = {"node", "--max-old-space-size={memory_limit_mb}", "{entry}"},
        .run_timeout = DEFAULT_RUN_TIMEOUT,
        .memory_limit_kb = 256 * MB,
        .limit_address_space = false,
        .baseline_runtime = 1000ms,
    });

    return profiles;
}

ToolchainRegistry::ToolchainRegistry(std::vector<LanguageProfile> profiles)
    : profiles_{std::move(profiles)} {
    std::set<std::string, std::less<>> seen;

    for (const LanguageProfile& profile : profiles_) {
        for (const auto* exts : {&profile.extensions, &profile.auxiliary_extensions}) {
            for (const std::string& ext : *exts) {
                ASSERT(!ext.empty() && ext.front() == '.', "extensions must start with a dot", profile.name, ext);

                bool inserted = seen.insert(ext).second;
                ASSERT(inserted, "extension claimed by more than one language", profile.name, ext);
            }
        }

        ASSERT(!profile.run_command.empty(), "every language needs a run command", profile.name);
    }

    LOG_DEBUG("Toolchain registry initialized with {} languages", profiles_.size());
}

std::optional<std::reference_wrapper<const LanguageProfile>>
ToolchainRegistry::resolve(std::string_view extension) const {
    auto iter = ranges::find_if(profiles_, [extension](const LanguageProfile& profile) {
        return profile.has_extension(extension);
    });

    if (iter == profiles_.end()) {
        return std::nullopt;
    }

    return *iter;
}

bool ToolchainRegistry::is_known_extension(std::string_view extension) const {
    return resolve(extension).has_value() ||
           ranges::find_if(profiles_, [extension](const LanguageProfile& profile) {
               return profile.has_auxiliary_extension(extension);
           }) != profiles_.end();
}

std::optional<std::reference_wrapper<const LanguageProfile>> ToolchainRegistry::find(std::string_view name) const {
    auto iequals = [name](const LanguageProfile& profile) {
        return ranges::equal(profile.name, name, [](unsigned char lhs, unsigned char rhs) {
            return std::tolower(lhs) == std::tolower(rhs);
        });
    };

    if (auto iter = ranges::find_if(profiles_, iequals); iter != profiles_.end()) {
        return *iter;
    }

    return std::nullopt;
}

} // namespace polygrader
