#include "subprocess/run_result.hpp"

#include <optional>

namespace polygrader {

RunResult::RunResult(Kind kind, int code, ResourceUsage usage)
    : kind_{kind}
    , code_{code}
    , usage_{usage} {}

RunResult RunResult::make_exited(int code, ResourceUsage usage) {
    return {Kind::Exited, code, usage};
}

RunResult RunResult::make_signaled(int signal, ResourceUsage usage) {
    return {Kind::Signaled, signal, usage};
}

RunResult RunResult::make_timed_out(ResourceUsage usage) {
    return {Kind::TimedOut, 0, usage};
}

RunResult RunResult::make_memory_exceeded(ResourceUsage usage) {
    return {Kind::MemoryExceeded, 0, usage};
}

std::optional<int> RunResult::get_exit_code() const {
    if (kind_ != Kind::Exited) {
        return std::nullopt;
    }
    return code_;
}

std::optional<int> RunResult::get_signal() const {
    if (kind_ != Kind::Signaled) {
        return std::nullopt;
    }
    return code_;
}

} // namespace polygrader
