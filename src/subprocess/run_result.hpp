#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace polygrader {

/// Resources consumed by a finished process group
struct ResourceUsage
{
    std::chrono::milliseconds wall_time{};
    std::chrono::milliseconds cpu_time{};

    /// Largest resident set observed, in KiB
    std::size_t peak_memory_kb = 0;
};

/// How a supervised process came to an end
class RunResult
{
public:
    enum class Kind { Exited, Signaled, TimedOut, MemoryExceeded };

    static RunResult make_exited(int code, ResourceUsage usage);
    static RunResult make_signaled(int signal, ResourceUsage usage);
    static RunResult make_timed_out(ResourceUsage usage);
    static RunResult make_memory_exceeded(ResourceUsage usage);

    Kind get_kind() const noexcept { return kind_; }

    /// Set only for `Kind::Exited`
    std::optional<int> get_exit_code() const;

    /// Set only for `Kind::Signaled`
    std::optional<int> get_signal() const;

    const ResourceUsage& get_usage() const noexcept { return usage_; }

private:
    RunResult(Kind kind, int code, ResourceUsage usage);

    Kind kind_;
    int code_;
    ResourceUsage usage_;
};

} // namespace polygrader
