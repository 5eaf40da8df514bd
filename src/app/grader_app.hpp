#pragma once

#include "app/app.hpp" // IWYU pragma: export
#include "user/config_reader.hpp"
#include "user/program_options.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/grading_session.hpp>

#include <string>
#include <vector>

namespace polygrader {

/// The command line front end: loads the configuration and every group's hand-in, evaluates
/// the batch, and reports results as they come in.
class GraderApp final : public App
{
public:
    using App::App;

    static constexpr int EXIT_ALL_GRADED = 0;
    static constexpr int EXIT_GRADES_WITHHELD = 1;
    static constexpr int EXIT_USAGE_ERROR = 2;

private:
    int run_impl() override;

    /// The configuration file (or the defaults) with command line overrides applied, validated
    Expected<EvaluatorConfig, std::string> load_config() const;

    Expected<std::vector<GroupSubmission>, std::string> load_groups() const;
    Expected<std::vector<GroupSubmission>, std::string> load_groups_from_manifest() const;
    Expected<std::vector<GroupSubmission>, std::string> load_groups_from_dirs() const;
};

} // namespace polygrader
