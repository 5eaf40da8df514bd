#pragma once

#include "output/result_record.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <polygrader/grading_session.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace polygrader {

class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity);

    void on_run_metadata(const RunMetadata& data) override;
    void on_group_result(const ResultRecord& record) override;
    void on_batch_result(const BatchResult& data) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    /// Colored name of an execution state, or the withheld marker
    std::string state_text(const ResultRecord& record) const;

    /// Indented block of captured output, with a note when it was cut short
    std::string output_block(std::string_view label, std::string_view text, bool truncated) const;

    template <typename T>
    std::string style_str(const T& arg, fmt::text_style style) const;

    /// Conditionally make a word singular or plural based on `count`
    ///
    /// Examples:
    ///  pluralize("group", 0) => "groups"
    ///  pluralize("group", 1) => "group"
    static std::string pluralize(std::string_view root, std::size_t count, std::string_view suffix = "s");

    // Basic styles for different kinds of output:
    //   error    - system faults, crashes, fatal errors
    //   warning  - partial outcomes
    //   success  - clean runs
    //   value    - grades and other numbers
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto POP_OUT_STYLE =
        fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::golden_rod);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static constexpr auto MAKE_LINE_DIVIDER = [](char chr) {
        return [chr](std::size_t len) { return std::string(len, chr); };
    };

    // Line Divider 2x Emphasized : "#######"...
    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static const inline auto LINE_DIVIDER = MAKE_LINE_DIVIDER('-');
    static const inline auto LINE_DIVIDER_EM = MAKE_LINE_DIVIDER('=');
    static const inline auto LINE_DIVIDER_2EM = MAKE_LINE_DIVIDER('#');

    bool do_colorize_;
    std::size_t terminal_width_;
};

template <typename T>
std::string PlainTextSerializer::style_str(const T& arg, fmt::text_style style) const {
    if (!do_colorize_) {
        return fmt::format("{}", arg);
    }

    return fmt::format(style, "{}", arg);
}

} // namespace polygrader
