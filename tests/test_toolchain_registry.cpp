#include "catch2_custom.hpp"

#include "test_helpers.hpp"
#include "toolchain/toolchain_registry.hpp"

#include <polygrader/language_profile.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

using namespace polygrader;
using namespace std::chrono_literals;

TEST_CASE("Built-in languages resolve by extension") {
    const auto registry = ToolchainRegistry::with_builtin_languages();

    REQUIRE(registry.size() == 5);

    auto name_of = [&](std::string_view ext) { return registry.resolve(ext)->get().name; };

    REQUIRE(name_of(".c") == "C");
    REQUIRE(name_of(".cpp") == "C++");
    REQUIRE(name_of(".cc") == "C++");
    REQUIRE(name_of(".cxx") == "C++");
    REQUIRE(name_of(".java") == "Java");
    REQUIRE(name_of(".py") == "Python");
    REQUIRE(name_of(".js") == "JavaScript");

    REQUIRE_FALSE(registry.resolve(".rs"));
    REQUIRE_FALSE(registry.resolve(""));
}

TEST_CASE("Headers are known but never resolve to a language") {
    const auto registry = ToolchainRegistry::with_builtin_languages();

    for (const char* ext : {".h", ".hpp"}) {
        REQUIRE_FALSE(registry.resolve(ext));
        REQUIRE(registry.is_known_extension(ext));
    }

    REQUIRE_FALSE(registry.is_known_extension(".txt"));
}

TEST_CASE("Language lookup by name ignores case") {
    const auto registry = ToolchainRegistry::with_builtin_languages();

    REQUIRE(registry.find("python")->get().name == "Python");
    REQUIRE(registry.find("JAVASCRIPT")->get().name == "JavaScript");
    REQUIRE(registry.find("c++")->get().name == "C++");
    REQUIRE_FALSE(registry.find("cobol"));
}

TEST_CASE("Built-in profiles match their execution model") {
    const auto registry = ToolchainRegistry::with_builtin_languages();

    for (const LanguageProfile& profile : registry.profiles()) {
        INFO(profile.name);

        REQUIRE(profile.needs_compile() == (profile.model != ExecutionModel::Interpreted));
        REQUIRE(profile.run_timeout > 0ms);
        REQUIRE(profile.memory_limit_kb > 0);
        REQUIRE(profile.baseline_runtime > 0ms);
        REQUIRE_FALSE(profile.run_command.empty());
    }

    // Runtimes that reserve large virtual ranges up front take their ceiling as a flag
    REQUIRE_FALSE(registry.find("Java")->get().limit_address_space);
    REQUIRE_FALSE(registry.find("JavaScript")->get().limit_address_space);
    REQUIRE(registry.find("C")->get().limit_address_space);
}

TEST_CASE("Adding a language is only a matter of adding a profile") {
    auto profiles = builtin_language_profiles();
    profiles.push_back(test::shell_profile());

    const ToolchainRegistry registry{profiles};

    REQUIRE(registry.size() == 6);
    REQUIRE(registry.resolve(".sh")->get().name == "Shell");
}

TEST_CASE("Duplicate extensions are rejected") {
    auto profiles = builtin_language_profiles();
    auto clashing = test::shell_profile();
    clashing.extensions = {".py"};
    profiles.push_back(clashing);

    REQUIRE_THROWS_AS(ToolchainRegistry{profiles}, std::runtime_error);
}
