#pragma once

#include "subprocess/run_result.hpp"

#include <polygrader/common/class_traits.hpp>
#include <polygrader/common/error_types.hpp>
#include <polygrader/grading_session.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <sys/resource.h>
#include <sys/types.h>

namespace polygrader {

struct ProcessLimits
{
    std::chrono::milliseconds wall_timeout{std::chrono::seconds{10}};

    /// 0 disables the memory ceiling
    std::size_t memory_limit_kb = 0;

    /// Enforce the ceiling through RLIMIT_AS as well as RSS sampling
    bool limit_address_space = false;

    /// Per stream; bytes past the cap are read and discarded
    std::size_t output_cap_bytes = 64 * 1024;

    /// Largest file the process may write (RLIMIT_FSIZE)
    std::size_t max_file_size_kb = 64 * 1024;
};

/// RLIMIT_CPU for a child with the given wall clock deadline. CPU time adds up across
/// threads, so the limit scales with the number of cores and stays out of the way of the
/// deadline for multi-threaded programs.
std::chrono::seconds cpu_time_backstop(std::chrono::milliseconds wall_timeout, unsigned cores);

/// A child process running in a process group of its own, with stdin at /dev/null and
/// stdout/stderr captured up to a cap.
///
/// The process group is always SIGKILLed before the child is reaped, so nothing the child
/// spawned outlives it (short of escaping the group with setsid(2)).
class Subprocess : NonMovable
{
public:
    /// ``exec`` is the absolute path of the program to run, ``argv`` its full argument
    /// vector (including argv[0]). The child starts in ``working_dir``.
    Subprocess(std::filesystem::path exec, std::vector<std::string> argv, std::filesystem::path working_dir);

    /// Kills and reaps the child if it is still around
    ~Subprocess();

    /// Forks and execs the child. Errors setting up the child (including a failed exec)
    /// are reported here, never as a result of the program itself.
    Result<void> start(const ProcessLimits& limits);

    /// Supervises the child until it exits, its deadline passes, it exceeds its memory
    /// ceiling, or ``stop_token`` is triggered (reported as `ErrorKind::Cancelled`).
    ///
    /// Returns within the wall timeout plus a short, bounded grace period.
    Result<RunResult> wait_for_exit(std::stop_token stop_token = {});

    /// SIGKILLs the entire process group. Does not reap.
    Result<void> kill();

    /// Whether the child has been started and not yet reaped
    bool is_alive() const noexcept { return pid_ != 0 && !reaped_; }

    pid_t get_pid() const noexcept { return pid_; }

    const CapturedOutput& get_stdout() const noexcept { return stdout_; }
    const CapturedOutput& get_stderr() const noexcept { return stderr_; }

private:
    /// Reads everything currently available from ``fd`` into ``capture``.
    /// Closes ``fd`` (and sets it to -1) on EOF.
    void drain(int& fd, CapturedOutput& capture) const;

    /// Keeps draining output after the group was killed, until EOF or a short grace period ends
    void drain_remaining();

    /// Resident set size of the child, in KiB, from /proc/<pid>/statm
    std::optional<std::size_t> sample_rss_kb() const;

    /// Blocks until the (already killed or exited) child is reaped
    Result<int> reap(::rusage& usage);

    void close_fds() noexcept;

    std::filesystem::path exec_;
    std::vector<std::string> argv_;
    std::filesystem::path working_dir_;

    ProcessLimits limits_;

    pid_t pid_ = 0;
    bool reaped_ = false;
    std::chrono::steady_clock::time_point start_time_;

    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    CapturedOutput stdout_;
    CapturedOutput stderr_;
};

} // namespace polygrader
