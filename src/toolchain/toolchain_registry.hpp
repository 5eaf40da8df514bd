#pragma once

#include <polygrader/language_profile.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace polygrader {

/// Profiles for C, C++, Java, Python and JavaScript, with default limits
std::vector<LanguageProfile> builtin_language_profiles();

/// Maps file extensions to language profiles.
///
/// Immutable once constructed, so a single registry may be shared by every worker.
class ToolchainRegistry
{
public:
    /// Extensions (regular and auxiliary) must be unique across ``profiles``
    explicit ToolchainRegistry(std::vector<LanguageProfile> profiles);

    static ToolchainRegistry with_builtin_languages() { return ToolchainRegistry{builtin_language_profiles()}; }

    /// Finds the language that ``extension`` (lowercase, with the leading dot) is a source of.
    /// Auxiliary extensions do not resolve.
    std::optional<std::reference_wrapper<const LanguageProfile>> resolve(std::string_view extension) const;

    /// Whether ``extension`` is a source or auxiliary extension of any language
    bool is_known_extension(std::string_view extension) const;

    /// Case-insensitive lookup by language name
    std::optional<std::reference_wrapper<const LanguageProfile>> find(std::string_view name) const;

    const std::vector<LanguageProfile>& profiles() const noexcept { return profiles_; }

    std::size_t size() const noexcept { return profiles_.size(); }

private:
    std::vector<LanguageProfile> profiles_;
};

} // namespace polygrader
