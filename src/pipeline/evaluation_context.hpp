#pragma once

#include <filesystem>
#include <stop_token>
#include <string>

namespace polygrader {

/// State of one in-flight evaluation, handed explicitly through every stage.
/// Nothing about a run lives anywhere else, so concurrent runs never share state.
struct EvaluationContext
{
    std::string group_id;

    /// The run's private workspace; every process of the run starts here
    std::filesystem::path workdir;

    std::stop_token stop_token;
};

} // namespace polygrader
