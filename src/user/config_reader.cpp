#include "user/config_reader.hpp"

#include "grading/grading_policy.hpp"
#include "pipeline/submission_pipeline.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/language_profile.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace polygrader {

namespace {

std::string_view trim(std::string_view str) {
    constexpr std::string_view WHITESPACE = " \t";

    auto first = str.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = str.find_last_not_of(WHITESPACE);

    return str.substr(first, last - first + 1);
}

bool iequals(std::string_view lhs, std::string_view rhs) {
    return ranges::equal(lhs, rhs, [](unsigned char lhs_chr, unsigned char rhs_chr) {
        return std::tolower(lhs_chr) == std::tolower(rhs_chr);
    });
}

std::optional<std::size_t> parse_unsigned(std::string_view value) {
    std::size_t res{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), res);

    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }

    return res;
}

std::optional<double> parse_double(std::string_view value) {
    double res{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), res);

    if (ec != std::errc{} || ptr != value.data() + value.size() || !std::isfinite(res)) {
        return std::nullopt;
    }

    return res;
}

std::optional<bool> parse_bool(std::string_view value) {
    if (value == "true" || value == "yes" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "0") {
        return false;
    }

    return std::nullopt;
}

/// Sets the config field named by ``key`` to ``value``
Expected<void, std::string> apply_entry(EvaluatorConfig& config, std::string_view key, std::string_view value) {
    auto as_unsigned = [&]() -> Expected<std::size_t, std::string> {
        if (auto res = parse_unsigned(value)) {
            return *res;
        }
        return fmt::format("value {:?} of {:?} is not a non-negative integer", value, key);
    };

    // Checked here as well as in validate, since larger counts do not fit in a duration
    auto as_millis = [&]() -> Expected<std::chrono::milliseconds, std::string> {
        const std::size_t count = TRY(as_unsigned());
        if (count > static_cast<std::size_t>(EvaluatorConfig::MAX_TIMEOUT.count())) {
            return fmt::format("value {:?} of {:?} is above the maximum of {}", value, key,
                               EvaluatorConfig::MAX_TIMEOUT.count());
        }
        return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(count)};
    };

    auto as_double = [&]() -> Expected<double, std::string> {
        if (auto res = parse_double(value)) {
            return *res;
        }
        return fmt::format("value {:?} of {:?} is not a number", value, key);
    };

    auto as_bool = [&]() -> Expected<bool, std::string> {
        if (auto res = parse_bool(value)) {
            return *res;
        }
        return fmt::format("value {:?} of {:?} is not a boolean", value, key);
    };

    ScoreBands& bands = config.policy.bands;
    GradeWeights& weights = config.policy.weights;

    if (key == "workers") {
        config.workers = TRY(as_unsigned());
    } else if (key == "output_cap_bytes") {
        config.output_cap_bytes = TRY(as_unsigned());
    } else if (key == "compile_timeout_ms") {
        config.compile_timeout = TRY(as_millis());
    } else if (key == "memory_limit_mb") {
        config.memory_limit_mb = TRY(as_unsigned());
    } else if (key == "work_root") {
        config.work_root = std::filesystem::path{value};
    } else if (key == "keep_workspaces") {
        config.keep_workspaces = TRY(as_bool());
    } else if (key == "weights.code") {
        weights.code = TRY(as_double());
    } else if (key == "weights.execution") {
        weights.execution = TRY(as_double());
    } else if (key == "weights.documentation") {
        weights.documentation = TRY(as_double());
    } else if (key == "score.timed_out") {
        bands.timed_out = TRY(as_double());
    } else if (key == "score.crashed.low") {
        bands.crashed.low = TRY(as_double());
    } else if (key == "score.crashed.high") {
        bands.crashed.high = TRY(as_double());
    } else if (key == "score.error_output.low") {
        bands.error_output.low = TRY(as_double());
    } else if (key == "score.error_output.high") {
        bands.error_output.high = TRY(as_double());
    } else if (key == "score.success.base") {
        bands.success_base = TRY(as_double());
    } else if (key == "score.success.bonus_cap") {
        bands.success_bonus_cap = TRY(as_double());
    } else if (key.starts_with("timeout_ms.") && key.size() > 11) {
        std::string language{key.substr(11)};
        config.language_overrides[language].run_timeout = TRY(as_millis());
    } else if (key.starts_with("memory_limit_mb.") && key.size() > 16) {
        std::string language{key.substr(16)};
        config.language_overrides[language].memory_limit_mb = TRY(as_unsigned());
    } else {
        return fmt::format("unknown key {:?}", key);
    }

    return {};
}

} // namespace

Expected<void, std::string> EvaluatorConfig::validate() {
    if (workers == 0) {
        return std::string{"workers must be positive"};
    }

    if (output_cap_bytes == 0) {
        return std::string{"output_cap_bytes must be positive"};
    }

    if (compile_timeout.count() <= 0 || compile_timeout > MAX_TIMEOUT) {
        return fmt::format("compile_timeout_ms must be between 1 and {}", MAX_TIMEOUT.count());
    }

    if (memory_limit_mb && (*memory_limit_mb == 0 || *memory_limit_mb > MAX_MEMORY_LIMIT_MB)) {
        return fmt::format("memory_limit_mb must be between 1 and {}", MAX_MEMORY_LIMIT_MB);
    }

    for (const auto& [language, limits] : language_overrides) {
        if (limits.run_timeout && (limits.run_timeout->count() <= 0 || *limits.run_timeout > MAX_TIMEOUT)) {
            return fmt::format("timeout_ms.{} must be between 1 and {}", language, MAX_TIMEOUT.count());
        }
        if (limits.memory_limit_mb &&
            (*limits.memory_limit_mb == 0 || *limits.memory_limit_mb > MAX_MEMORY_LIMIT_MB)) {
            return fmt::format("memory_limit_mb.{} must be between 1 and {}", language, MAX_MEMORY_LIMIT_MB);
        }
    }

    if (work_root && !std::filesystem::is_directory(*work_root)) {
        return fmt::format("work_root {:?} is not a directory", work_root->string());
    }

    policy = TRY(validate_policy(policy));

    return {};
}

Expected<std::vector<LanguageProfile>, std::string>
EvaluatorConfig::apply_overrides(std::vector<LanguageProfile> profiles) const {
    constexpr std::size_t KB_PER_MB = 1024;

    if (memory_limit_mb) {
        for (LanguageProfile& profile : profiles) {
            profile.memory_limit_kb = *memory_limit_mb * KB_PER_MB;
        }
    }

    for (const auto& [language, limits] : language_overrides) {
        auto profile_it = ranges::find_if(
            profiles, [&lang = language](const LanguageProfile& profile) { return iequals(profile.name, lang); });

        if (profile_it == profiles.end()) {
            return fmt::format("Limits given for unknown language {:?}", language);
        }

        if (limits.run_timeout) {
            profile_it->run_timeout = *limits.run_timeout;
        }
        if (limits.memory_limit_mb) {
            profile_it->memory_limit_kb = *limits.memory_limit_mb * KB_PER_MB;
        }

        LOG_DEBUG("Limits for {}: timeout = {}, memory = {} KiB", profile_it->name, profile_it->run_timeout,
                  profile_it->memory_limit_kb);
    }

    return std::move(profiles);
}

PipelineOptions EvaluatorConfig::pipeline_options() const {
    PipelineOptions options;

    if (work_root) {
        options.work_root = *work_root;
    }

    options.keep_workspaces = keep_workspaces;
    options.build = BuildOptions{.compile_timeout = compile_timeout, .output_cap_bytes = output_cap_bytes};
    options.sandbox = SandboxOptions{.output_cap_bytes = output_cap_bytes};

    return options;
}

ConfigReader::ConfigReader(std::filesystem::path path)
    : path_{std::move(path)} {}

Expected<EvaluatorConfig, std::string> ConfigReader::read() const {
    std::ifstream in_file{path_};

    if (not in_file.is_open()) {
        return fmt::format("Failed to open configuration file {:?}", path_.string());
    }

    std::string text{std::istreambuf_iterator<char>{in_file}, std::istreambuf_iterator<char>{}};

    if (in_file.bad()) {
        return fmt::format("IO error in reading {:?}", path_.string());
    }

    auto config = parse(text);

    if (!config) {
        return fmt::format("{}: {}", path_.string(), config.error());
    }

    return config;
}

Expected<EvaluatorConfig, std::string> ConfigReader::parse(std::string_view text) {
    EvaluatorConfig config;

    std::istringstream stream{std::string{text}};
    std::string line;
    std::size_t line_num = 0;

    while (std::getline(stream, line)) {
        ++line_num;

        // Tolerate windows line endings
        if (line.ends_with('\r')) {
            line.resize(line.size() - 1);
        }

        std::string_view content = trim(line);

        if (content.empty() || content.starts_with('#')) {
            continue;
        }

        auto eq_pos = content.find('=');
        if (eq_pos == std::string_view::npos) {
            return fmt::format("line {}: expected `key = value`, got {:?}", line_num, content);
        }

        std::string_view key = trim(content.substr(0, eq_pos));
        std::string_view value = trim(content.substr(eq_pos + 1));

        if (key.empty() || value.empty()) {
            return fmt::format("line {}: expected `key = value`, got {:?}", line_num, content);
        }

        if (auto res = apply_entry(config, key, value); !res) {
            return fmt::format("line {}: {}", line_num, res.error());
        }
    }

    return config;
}

} // namespace polygrader
