#include "output/plaintext_serializer.hpp"

#include "common/terminal_checks.hpp"
#include "common/time.hpp"
#include "output/result_record.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <polygrader/grading_session.hpp>
#include <polygrader/logging.hpp>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>
#include <range/v3/algorithm/count_if.hpp>

#include <array>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace polygrader {

namespace {

constexpr std::size_t LABEL_WIDTH = 20;

/// Fields that are printed as blocks (or not at all) rather than as "label : value" lines
constexpr std::array<std::string_view, 5> BLOCK_FIELDS = {"files", "stdout", "stderr", "compiler_output",
                                                          "system_fault"};

bool is_block_field(std::string_view name) {
    for (std::string_view block : BLOCK_FIELDS) {
        if (name == block) {
            return true;
        }
    }
    return false;
}

} // namespace

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_run_metadata(const RunMetadata& data) {
    if (!should_output_run_metadata(verbosity_)) {
        return;
    }

    constexpr std::string_view header_text = " Grading Run ";
    constexpr std::string_view version_label = "Version: ";
    constexpr std::string_view date_label = "Date and Time: ";
    constexpr std::string_view work_label = "Workload: ";

    std::string local_timepoint_text = to_localtime_string(data.start_time, "%a %b %d %T %Y").value_or("<ERROR>");
    std::string work_text = fmt::format("{} {} on {} {}", data.num_groups, pluralize("group", data.num_groups),
                                        data.num_workers, pluralize("worker", data.num_workers));

    std::string out = fmt::format("{:#^{}}\n", header_text, terminal_width_);
    out += fmt::format("{}{:>{}}\n", version_label, data.version_string, terminal_width_ - version_label.size());
    out += fmt::format("{}{:>{}}\n", date_label, local_timepoint_text, terminal_width_ - date_label.size());
    out += fmt::format("{}{:>{}}\n", work_label, work_text, terminal_width_ - work_label.size());
    out += LINE_DIVIDER_2EM(terminal_width_) + "\n\n";

    sink_->write(out);
}

void PlainTextSerializer::on_group_result(const ResultRecord& record) {
    if (should_output_group_line(verbosity_)) {
        std::string grade_text;
        if (record.final_grade) {
            grade_text = " " + style_str(fmt::format("{:.2f}/20", *record.final_grade), VALUE_STYLE);
        }
        sink_->write(fmt::format("{}: {}{}\n", style_str(record.group, POP_OUT_STYLE), state_text(record), grade_text));
        return;
    }

    if (!should_output_record(verbosity_)) {
        return;
    }

    std::string out = fmt::format("{}\nGroup: {}\n{}\n", LINE_DIVIDER_EM(terminal_width_),
                                  style_str(record.group, POP_OUT_STYLE), LINE_DIVIDER(terminal_width_));

    for (const auto& [name, value] : record.fields()) {
        if (name == "group" || is_block_field(name)) {
            continue;
        }

        std::string value_text;
        if (name == "execution_state") {
            value_text = state_text(record);
        } else if (name == "final_grade" && !value.empty()) {
            value_text = style_str(fmt::format("{} / 20", value), VALUE_STYLE);
        } else if (value.empty()) {
            value_text = "-";
        } else {
            value_text = value;
        }

        out += fmt::format("  {:<{}}: {}\n", name, LABEL_WIDTH, value_text);
    }

    if (record.system_fault) {
        out += style_str(fmt::format("  GRADE WITHHELD (system fault: {})", *record.system_fault), ERROR_STYLE);
        out += "\n";
    }

    if (should_output_file_list(verbosity_)) {
        out += "  files:\n";
        for (const std::string& file : record.files) {
            out += fmt::format("    {}\n", file);
        }
    }

    if (should_output_captured_output(verbosity_)) {
        out += output_block("compiler output", record.compiler_output, false);
        out += output_block("stdout", record.stdout_text, record.stdout_truncated);
        out += output_block("stderr", record.stderr_text, record.stderr_truncated);
    } else if (record.stdout_truncated || record.stderr_truncated) {
        out += style_str("  (captured output was truncated at the configured cap)", WARNING_STYLE);
        out += "\n";
    }

    sink_->write(out);
}

void PlainTextSerializer::on_batch_result(const BatchResult& data) {
    if (!should_output_batch_summary(verbosity_)) {
        return;
    }

    std::string out = fmt::format("{}\nSummary\n{}\n", LINE_DIVIDER_EM(terminal_width_), LINE_DIVIDER(terminal_width_));

    for (auto state : {ExecutionState::RanSuccessfully, ExecutionState::RanWithErrorOutput, ExecutionState::Crashed,
                       ExecutionState::TimedOut, ExecutionState::CompileFailed, ExecutionState::NotAttempted}) {
        auto num = ranges::count_if(data.results, [state](const GroupResult& res) { return res.state == state; });
        out += fmt::format("  {:<{}}: {}\n", state, LABEL_WIDTH, num);
    }

    const std::size_t num_graded = data.num_graded();
    const std::size_t num_faults = data.num_system_faults();

    double total = 0.0;
    for (const GroupResult& res : data.results) {
        if (res.grade) {
            total += res.grade->final_grade;
        }
    }

    out += fmt::format("  {:<{}}: {} of {}\n", "graded", LABEL_WIDTH, num_graded, data.results.size());
    if (num_graded > 0) {
        out += fmt::format("  {:<{}}: {}\n", "average grade", LABEL_WIDTH,
                           style_str(fmt::format("{:.2f} / 20", total / static_cast<double>(num_graded)), VALUE_STYLE));
    }
    if (num_faults > 0) {
        out += style_str(fmt::format("  {} {} withheld because of system faults", num_faults,
                                     pluralize("grade", num_faults)),
                         ERROR_STYLE);
        out += "\n";
    }
    if (data.cancelled) {
        out += style_str("  Run was cancelled before every group finished", WARNING_STYLE);
        out += "\n";
    }

    out += fmt::format("  {:<{}}: {}\n", "elapsed", LABEL_WIDTH, data.elapsed);

    sink_->write(out);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    sink_->write(style_str(what, WARNING_STYLE) + "\n");
}

void PlainTextSerializer::on_error(std::string_view what) {
    sink_->write(style_str(what, ERROR_STYLE) + "\n");
}

void PlainTextSerializer::finalize() {
    sink_->flush();
}

std::string PlainTextSerializer::state_text(const ResultRecord& record) const {
    if (record.system_fault) {
        return style_str("GRADE WITHHELD", ERROR_STYLE);
    }

    switch (record.execution_state) {
    case ExecutionState::RanSuccessfully:
        return style_str(record.execution_state, SUCCESS_STYLE);
    case ExecutionState::RanWithErrorOutput:
    case ExecutionState::TimedOut:
        return style_str(record.execution_state, WARNING_STYLE);
    case ExecutionState::Crashed:
    case ExecutionState::CompileFailed:
    case ExecutionState::NotAttempted:
        break;
    }

    return style_str(record.execution_state, ERROR_STYLE);
}

std::string PlainTextSerializer::output_block(std::string_view label, std::string_view text, bool truncated) const {
    if (text.empty()) {
        return fmt::format("  {}: <empty>\n", label);
    }

    std::string out = fmt::format("  {}:\n", label);

    std::string_view rest = text;
    while (!rest.empty()) {
        auto eol = rest.find('\n');
        out += fmt::format("    | {}\n", rest.substr(0, eol));

        if (eol == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(eol + 1);
    }

    if (truncated) {
        out += style_str("    [truncated]", WARNING_STYLE) + "\n";
    }

    return out;
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::string PlainTextSerializer::pluralize(std::string_view root, std::size_t count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout);

    if (!width) {
        LOG_DEBUG("Could not obtain terminal width ({}). Defaulting to {}", width.error().message(), DEFAULT_WIDTH);
        return DEFAULT_WIDTH;
    }

    if (width.value().ws_col == 0) {
        return DEFAULT_WIDTH;
    }

    return width.value().ws_col;
}

} // namespace polygrader
