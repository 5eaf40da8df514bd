#pragma once

#include <polygrader/common/formatters/enum.hpp>

#include <range/v3/algorithm/any_of.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

/// How a language's sources turn into something runnable
enum class ExecutionModel {
    CompiledNative,   ///< compiled ahead of time into a native executable
    CompiledBytecode, ///< compiled into bytecode that a virtual machine runs
    Interpreted,      ///< run directly from source
};

POLYGRADER_ENUM_NAMES(ExecutionModel, CompiledNative, CompiledBytecode, Interpreted);

/// A command line with placeholders, one token per argv entry.
///
/// Placeholders are expanded by `expand_command` (see toolchain/command_template.hpp):
///   {sources}         every source file of the detected language, one argv entry each
///   {entry}           the entry-point file, relative to the working directory
///   {entry_class}     the entry point's (package-qualified) class name
///   {build_dir}       directory that compile steps write into
///   {output}          path of the produced native executable
///   {memory_limit_mb} memory ceiling, for runtimes that take it as a flag
using CommandTemplate = std::vector<std::string>;

/// Everything the grader needs to know to detect, build, and run one language.
/// Adding a language means adding one of these to the registry; nothing else changes.
struct LanguageProfile
{
    std::string name;
    ExecutionModel model;

    /// lowercase, with the leading dot (e.g. ".cpp")
    std::vector<std::string> extensions;

    /// Extensions that belong to the language but never vote in detection, nor are passed
    /// to the compiler (e.g. headers)
    std::vector<std::string> auxiliary_extensions;

    /// File stems recognized as an entry point (e.g. "main", "Main", "index")
    std::vector<std::string> entry_names;

    /// ECMAScript regex matched against file content to find an entry point when no
    /// file name matches. Empty to disable.
    std::string entry_signature;

    std::optional<CommandTemplate> compile_command;
    CommandTemplate run_command;

    std::chrono::milliseconds run_timeout;
    std::size_t memory_limit_kb;

    /// Whether the memory ceiling is enforced with RLIMIT_AS. Runtimes that reserve large
    /// virtual ranges up front (JVM, V8) take their ceiling through a command line flag
    /// instead, and are additionally watched through RSS sampling.
    bool limit_address_space;

    /// Runtime of a trivial program, used to position a successful run within its score band
    std::chrono::milliseconds baseline_runtime;

    bool needs_compile() const noexcept { return compile_command.has_value(); }

    bool has_extension(std::string_view ext) const {
        return ranges::any_of(extensions, [ext](const std::string& candidate) { return candidate == ext; });
    }

    bool has_auxiliary_extension(std::string_view ext) const {
        return ranges::any_of(auxiliary_extensions, [ext](const std::string& candidate) { return candidate == ext; });
    }
};

} // namespace polygrader
