#pragma once

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>
#include <polygrader/language_profile.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

/// Values substituted into a `CommandTemplate`
struct CommandVars
{
    std::vector<std::string> sources;
    std::string entry;
    std::string entry_class;
    std::string build_dir;
    std::string output;
    std::size_t memory_limit_mb = 0;
};

/// Directory (relative to the workspace) that compile steps write into
inline constexpr std::string_view BUILD_DIR = "build";

/// Native executable produced by compile steps, relative to the workspace
inline constexpr std::string_view BUILD_OUTPUT = "build/program";

/// Class name to launch for a JVM entry point: the file stem, qualified with the
/// file's `package` declaration if it has one
std::string entry_class_name(const SourceFile& entry);

/// Placeholder values for running ``detection`` of ``submission`` inside a workspace
CommandVars make_command_vars(const Submission& submission, const Detection& detection);

/// Expands every placeholder in ``templ``. ``{sources}`` must stand alone as a token
/// and expands into one argument per source; the others may appear inside a token
/// (e.g. "-Xmx{memory_limit_mb}m").
///
/// Returns a description of the problem for unknown or malformed placeholders.
Expected<std::vector<std::string>, std::string> expand_command(const CommandTemplate& templ, const CommandVars& vars);

} // namespace polygrader
