#include "user/cl_args.hpp"

#include "common/terminal_checks.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/logging.hpp>
#include <polygrader/version.hpp>

#include <argparse/argparse.hpp>
#include <fmt/base.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace polygrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ POLYGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

double parse_score(const std::string& opt, std::string_view what) {
    std::size_t num_parsed = 0;
    double value{};

    try {
        value = std::stod(opt, &num_parsed);
    } catch (const std::exception& /*unused*/) {
        throw std::invalid_argument(fmt::format("{} {:?} is not a number", what, opt));
    }

    if (num_parsed != opt.size()) {
        throw std::invalid_argument(fmt::format("{} {:?} is not a number", what, opt));
    }

    return value;
}

} // namespace

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
        LOG_DEBUG("Cols = {}, px = {}", term_sz->ws_col, term_sz->ws_xpixel);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("PolyGrader v{}", POLYGRADER_VERSION_STRING));
    arg_parser_.add_epilog("Exit status: 0 when every group was graded, 1 when a grade was withheld "
                           "because of a system fault or an abort, 2 on usage errors.");

    // clang-format off
    arg_parser_.add_argument("submissions")
        .nargs(argparse::nargs_pattern::any)
        .metavar("DIR")
        .help("Submission directories, one per group. The directory name is the group id.");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::println(POLYGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    {
        // Block to reduce scope of `using enum`

        using enum VerbosityLevel;

        constexpr auto DEFAULT_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Max);
        constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

        constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
        constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

        arg_parser_.add_argument("-v", "--verbose")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                    if (level > MAX_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification exceeds maximum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
                })
            .append()
            .help(fmt::format("Increase verbosity level (up to {}x)", MAX_VERBOSITY_INCREASE));

        arg_parser_.add_argument("-q", "--quiet")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                    if (level < MIN_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification is lower than minimum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
                })
            .append()
            .help(fmt::format("Decrease verbosity level (up to {}x)", MAX_VERBOSITY_DECREASE));

        arg_parser_.add_argument("--silent")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    opts_buffer_.verbosity = Silent;
                })
            .help("Sets verbosity level to 'Silent', suppressing all output except for the return code. Useful for scripting.");

        opts_buffer_.verbosity = ProgramOptions::DEFAULT_VERBOSITY_LEVEL;
    }

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });

    arg_parser_.add_argument("-m", "--manifest")
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                opts_buffer_.manifest = opt;
        })
        .help("CSV manifest of groups: group,code_dir[,doc_dir[,static_score,doc_score]]\n"
              "Mutually exclusive with submission directories.");

    arg_parser_.add_argument("--config")
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                opts_buffer_.config_path = opt;
        })
        .help("Evaluator configuration file (key = value lines).");

    arg_parser_.add_argument("-j", "--workers")
        .nargs(1)
        .metavar("N")
        .action([this] (const std::string& opt) {
                std::size_t num_parsed = 0;
                unsigned long value = 0;

                try {
                    value = std::stoul(opt, &num_parsed);
                } catch (const std::exception& /*unused*/) {
                    throw std::invalid_argument(fmt::format("Number of workers {:?} is not a number", opt));
                }

                if (num_parsed != opt.size() || value == 0) {
                    throw std::invalid_argument(fmt::format("Number of workers {:?} must be a positive integer", opt));
                }

                opts_buffer_.workers = value;
        })
        .help("Number of groups evaluated concurrently. Overrides the configuration file.");

    arg_parser_.add_argument("--static-score")
        .nargs(1)
        .metavar("X")
        .action([this] (const std::string& opt) {
                opts_buffer_.static_score = parse_score(opt, "Static code score");
        })
        .help("Static code score (0-20) for groups without one of their own.");

    arg_parser_.add_argument("--doc-score")
        .nargs(1)
        .metavar("X")
        .action([this] (const std::string& opt) {
                opts_buffer_.doc_score = parse_score(opt, "Documentation score");
        })
        .help("Documentation score (0-20) for groups without one of their own.");

    arg_parser_.add_argument("--doc-dir")
        .nargs(1)
        .metavar("DIR")
        .action([this] (const std::string& opt) {
                opts_buffer_.doc_dir = opt;
        })
        .help("Directory holding one documentation directory per group, named after the group.");
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    if (auto dirs = arg_parser_.present<std::vector<std::string>>("submissions")) {
        opts_buffer_.submission_dirs.assign(dirs->begin(), dirs->end());
    }

    TRY(opts_buffer_.validate());

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::println(stderr, "{}\n{}", styled(opts_res.error(), fg(fmt::color::red)), cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace polygrader
