#include "subprocess/subprocess.hpp"

#include "subprocess/run_result.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/common/expected.hpp>
#include <polygrader/common/formatters/enum.hpp>
#include <polygrader/common/linux.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <fstream>
#include <optional>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace polygrader {

using namespace std::chrono_literals;

namespace {

/// How often the supervisor looks at the child when it produces no output
constexpr auto POLL_INTERVAL = 10ms;

/// How long output is still collected after the process group was killed
constexpr auto DRAIN_GRACE = 200ms;

constexpr std::size_t READ_CHUNK = 64 * 1024;

constexpr auto CPU_BACKSTOP_MARGIN = 2s;

enum class ChildStage { Setpgid, Sigmask, Redirect, Chdir, Rlimit, Exec };

POLYGRADER_ENUM_NAMES(ChildStage, Setpgid, Sigmask, Redirect, Chdir, Rlimit, Exec);

/// Sent from the child to the parent over a CLOEXEC pipe when setup or exec fails.
/// A successful exec closes the pipe instead.
struct ChildError
{
    ChildStage stage;
    int err;
};

/// Everything the child needs, prepared before fork so that the child
/// only makes async-signal-safe calls
struct ChildSetup
{
    const char* exec;
    char* const* argv;
    const char* working_dir;

    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
    int error_fd;

    bool limit_address_space;
    rlimit address_space;
    rlimit cpu_time;
    rlimit file_size;
};

[[noreturn]] void child_fail(int error_fd, ChildStage stage) noexcept {
    ChildError err{.stage = stage, .err = errno};

    // If this fails too, the parent sees an unexplained exit with status 127
    [[maybe_unused]] ssize_t written = ::write(error_fd, &err, sizeof(err));

    ::_exit(127);
}

[[noreturn]] void child_main(const ChildSetup& setup) noexcept {
    if (::setpgid(0, 0) == -1) {
        child_fail(setup.error_fd, ChildStage::Setpgid);
    }

    // The parent may block signals in its threads; the mask survives exec
    sigset_t empty_set;
    sigemptyset(&empty_set);
    if (::sigprocmask(SIG_SETMASK, &empty_set, nullptr) == -1) {
        child_fail(setup.error_fd, ChildStage::Sigmask);
    }

    // dup2 clears FD_CLOEXEC on the new descriptors
    if (::dup2(setup.stdin_fd, STDIN_FILENO) == -1 || ::dup2(setup.stdout_fd, STDOUT_FILENO) == -1 ||
        ::dup2(setup.stderr_fd, STDERR_FILENO) == -1) {
        child_fail(setup.error_fd, ChildStage::Redirect);
    }

    if (::chdir(setup.working_dir) == -1) {
        child_fail(setup.error_fd, ChildStage::Chdir);
    }

    const rlimit no_core{.rlim_cur = 0, .rlim_max = 0};
    if (::setrlimit(RLIMIT_CORE, &no_core) == -1 || ::setrlimit(RLIMIT_CPU, &setup.cpu_time) == -1 ||
        ::setrlimit(RLIMIT_FSIZE, &setup.file_size) == -1) {
        child_fail(setup.error_fd, ChildStage::Rlimit);
    }

    if (setup.limit_address_space && ::setrlimit(RLIMIT_AS, &setup.address_space) == -1) {
        child_fail(setup.error_fd, ChildStage::Rlimit);
    }

    ::execve(setup.exec, setup.argv, environ);

    child_fail(setup.error_fd, ChildStage::Exec);
}

void append_capped(CapturedOutput& capture, std::string_view chunk, std::size_t cap) {
    capture.total_bytes += chunk.size();

    std::size_t room = capture.data.size() < cap ? cap - capture.data.size() : 0;

    capture.data.append(chunk.substr(0, room));

    if (chunk.size() > room) {
        capture.truncated = true;
    }
}

std::chrono::milliseconds to_millis(const timeval& time) {
    return std::chrono::seconds{time.tv_sec} + std::chrono::duration_cast<std::chrono::milliseconds>(
                                                   std::chrono::microseconds{time.tv_usec});
}

} // namespace

std::chrono::seconds cpu_time_backstop(std::chrono::milliseconds wall_timeout, unsigned cores) {
    const auto wall_secs = std::chrono::ceil<std::chrono::seconds>(wall_timeout);
    return wall_secs * std::max(cores, 1U) + CPU_BACKSTOP_MARGIN;
}

Subprocess::Subprocess(std::filesystem::path exec, std::vector<std::string> argv, std::filesystem::path working_dir)
    : exec_{std::move(exec)}
    , argv_{std::move(argv)}
    , working_dir_{std::move(working_dir)} {}

Subprocess::~Subprocess() {
    if (is_alive()) {
        std::ignore = kill();

        rusage usage{};
        if (auto res = reap(usage); !res) {
            LOG_WARN("Could not reap child {} of {}: {}", pid_, exec_.string(), res.error());
        }
    }

    close_fds();
}

Result<void> Subprocess::start(const ProcessLimits& limits) {
    ASSERT(pid_ == 0, "a Subprocess may only be started once");
    ASSERT(!argv_.empty());

    limits_ = limits;

    std::vector<char*> c_argv;
    c_argv.reserve(argv_.size() + 1);
    for (std::string& arg : argv_) {
        c_argv.push_back(arg.data());
    }
    c_argv.push_back(nullptr);

    // All descriptors are CLOEXEC so that children forked concurrently by other
    // workers never hold on to our pipes
    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC); // NOLINT(*vararg)
    if (devnull == -1) {
        LOG_ERROR("Could not open /dev/null: {}", get_err_msg());
        return ErrorKind::SyscallFailure;
    }
    auto close_devnull = gsl::finally([devnull] { std::ignore = linux::close(devnull); });

    auto stdout_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stdout_fd_ = stdout_pipe.read_fd;
    auto close_stdout_write = gsl::finally([fd = stdout_pipe.write_fd] { std::ignore = linux::close(fd); });

    auto stderr_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stderr_fd_ = stderr_pipe.read_fd;
    auto close_stderr_write = gsl::finally([fd = stderr_pipe.write_fd] { std::ignore = linux::close(fd); });

    auto error_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    auto close_error_read = gsl::finally([fd = error_pipe.read_fd] { std::ignore = linux::close(fd); });

    const auto cpu_secs =
        static_cast<rlim_t>(cpu_time_backstop(limits.wall_timeout, std::thread::hardware_concurrency()).count());
    const auto fsize = static_cast<rlim_t>(limits.max_file_size_kb) * 1024;
    const auto address_space = static_cast<rlim_t>(limits.memory_limit_kb) * 1024;

    const ChildSetup setup{
        .exec = exec_.c_str(),
        .argv = c_argv.data(),
        .working_dir = working_dir_.c_str(),
        .stdin_fd = devnull,
        .stdout_fd = stdout_pipe.write_fd,
        .stderr_fd = stderr_pipe.write_fd,
        .error_fd = error_pipe.write_fd,
        .limit_address_space = limits.limit_address_space && limits.memory_limit_kb > 0,
        .address_space = {.rlim_cur = address_space, .rlim_max = address_space},
        .cpu_time = {.rlim_cur = cpu_secs, .rlim_max = cpu_secs + 1},
        .file_size = {.rlim_cur = fsize, .rlim_max = fsize},
    };

    LOG_DEBUG("Starting {} in {} (timeout={}, memory={}KiB)", fmt::join(argv_, " "), working_dir_.string(),
              limits.wall_timeout, limits.memory_limit_kb);

    start_time_ = std::chrono::steady_clock::now();

    auto fork_res = linux::fork();

    if (fork_res && fork_res.value().which == linux::Fork::Child) {
        child_main(setup);
    }

    // Close our copy of the write end, so the read below ends when the child execs
    std::ignore = linux::close(error_pipe.write_fd);

    if (!fork_res) {
        LOG_ERROR("Could not fork for {}: {}", exec_.string(), fork_res.error().message());
        return ErrorKind::SyscallFailure;
    }

    pid_ = fork_res.value().pid;

    // Also done by the child; doing it here too means the group exists before we ever
    // signal it. Fails harmlessly if the child already exec'd.
    std::ignore = linux::setpgid(pid_, pid_);

    Expected<std::string> report;
    do {
        report = linux::read(error_pipe.read_fd, sizeof(ChildError));
    } while (!report && report.error() == std::errc::interrupted);

    if (!report) {
        LOG_ERROR("Could not read exec status of {}: {}", exec_.string(), report.error().message());
        std::ignore = kill();
        return ErrorKind::SyscallFailure;
    }

    if (!report.value().empty()) {
        ChildError child_err{};
        std::memcpy(&child_err, report.value().data(), std::min(report.value().size(), sizeof(child_err)));

        LOG_ERROR("Could not start {}: {} failed ({})", exec_.string(), child_err.stage, get_err_msg(child_err.err));

        rusage usage{};
        TRY(reap(usage));

        return ErrorKind::ExecFailure;
    }

    for (int fd : {stdout_fd_, stderr_fd_}) {
        int flags = TRYE(linux::fcntl(fd, F_GETFL), SyscallFailure);
        TRYE(linux::fcntl(fd, F_SETFL, flags | O_NONBLOCK), SyscallFailure); // NOLINT
    }

    return {};
}

Result<RunResult> Subprocess::wait_for_exit(std::stop_token stop_token) {
    ASSERT(is_alive(), "wait_for_exit requires a running child");

    using std::chrono::steady_clock;

    const auto deadline = start_time_ + limits_.wall_timeout;
    const std::size_t memory_limit = limits_.memory_limit_kb;

    std::size_t peak_rss = 0;
    bool timed_out = false;
    bool memory_exceeded = false;
    bool cancelled = false;

    while (true) {
        if (stop_token.stop_requested()) {
            cancelled = true;
            break;
        }

        // WNOWAIT leaves the child a zombie, which keeps its process group id reserved
        // until we have killed the rest of the group
        auto info = TRYE(linux::waitid(P_PID, static_cast<id_t>(pid_), WEXITED | WNOHANG | WNOWAIT), SyscallFailure);
        if (info.si_pid == pid_) {
            break;
        }

        if (auto rss = sample_rss_kb()) {
            peak_rss = std::max(peak_rss, *rss);

            if (memory_limit > 0 && *rss > memory_limit) {
                LOG_DEBUG("Child {} uses {}KiB, above its {}KiB ceiling", pid_, *rss, memory_limit);
                memory_exceeded = true;
                break;
            }
        }

        const auto now = steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }

        const auto wait_time =
            std::min(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) + 1ms, POLL_INTERVAL);

        std::array<pollfd, 2> fds{{
            {.fd = stdout_fd_, .events = POLLIN, .revents = 0},
            {.fd = stderr_fd_, .events = POLLIN, .revents = 0},
        }};

        // Negative descriptors are ignored by poll
        TRYE(linux::poll(fds, static_cast<int>(wait_time.count())), SyscallFailure);

        drain(stdout_fd_, stdout_);
        drain(stderr_fd_, stderr_);
    }

    TRY(kill());
    drain_remaining();

    rusage usage{};
    const int status = TRY(reap(usage));

    const ResourceUsage resources{
        .wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - start_time_),
        .cpu_time = to_millis(usage.ru_utime) + to_millis(usage.ru_stime),
        // ru_maxrss is in KiB on Linux
        .peak_memory_kb = std::max(peak_rss, static_cast<std::size_t>(usage.ru_maxrss)),
    };

    if (cancelled) {
        LOG_DEBUG("Child {} cancelled after {}", pid_, resources.wall_time);
        return ErrorKind::Cancelled;
    }

    if (timed_out) {
        return RunResult::make_timed_out(resources);
    }

    if (memory_exceeded) {
        return RunResult::make_memory_exceeded(resources);
    }

    if (WIFEXITED(status)) {
        return RunResult::make_exited(WEXITSTATUS(status), resources);
    }

    ASSERT(WIFSIGNALED(status), status);

    // The CPU limit is only a backstop for the deadline. A SIGXCPU before the deadline
    // was raised by the program itself and counts as any other fatal signal.
    if (WTERMSIG(status) == SIGXCPU && resources.wall_time >= limits_.wall_timeout) {
        return RunResult::make_timed_out(resources);
    }

    return RunResult::make_signaled(WTERMSIG(status), resources);
}

Result<void> Subprocess::kill() {
    if (!is_alive()) {
        return {};
    }

    auto res = linux::killpg(pid_, SIGKILL);

    // Nothing left in the group
    if (!res && res.error() != std::errc::no_such_process) {
        LOG_WARN("Could not kill process group {}: {}", pid_, res.error().message());
        return ErrorKind::SyscallFailure;
    }

    return {};
}

void Subprocess::drain(int& fd, CapturedOutput& capture) const {
    while (fd != -1) {
        auto chunk = linux::read(fd, READ_CHUNK);

        if (!chunk) {
            if (chunk.error() == std::errc::interrupted) {
                continue;
            }
            if (chunk.error() != std::errc::resource_unavailable_try_again) {
                LOG_WARN("Reading output of child {} failed: {}", pid_, chunk.error().message());
                std::ignore = linux::close(fd);
                fd = -1;
            }
            return;
        }

        if (chunk.value().empty()) {
            std::ignore = linux::close(fd);
            fd = -1;
            return;
        }

        append_capped(capture, chunk.value(), limits_.output_cap_bytes);
    }
}

void Subprocess::drain_remaining() {
    const auto give_up = std::chrono::steady_clock::now() + DRAIN_GRACE;

    while ((stdout_fd_ != -1 || stderr_fd_ != -1) && std::chrono::steady_clock::now() < give_up) {
        std::array<pollfd, 2> fds{{
            {.fd = stdout_fd_, .events = POLLIN, .revents = 0},
            {.fd = stderr_fd_, .events = POLLIN, .revents = 0},
        }};

        if (auto res = linux::poll(fds, static_cast<int>(POLL_INTERVAL.count())); !res) {
            break;
        }

        drain(stdout_fd_, stdout_);
        drain(stderr_fd_, stderr_);
    }
}

std::optional<std::size_t> Subprocess::sample_rss_kb() const {
    static const auto page_kb = static_cast<std::size_t>(::sysconf(_SC_PAGESIZE)) / 1024;

    std::ifstream statm{fmt::format("/proc/{}/statm", pid_)};

    std::size_t total_pages = 0;
    std::size_t resident_pages = 0;

    if (!(statm >> total_pages >> resident_pages)) {
        return std::nullopt;
    }

    return resident_pages * page_kb;
}

Result<int> Subprocess::reap(rusage& usage) {
    auto res = TRYE(linux::wait4(pid_, 0), SyscallFailure);

    usage = res.usage;
    reaped_ = true;

    LOG_TRACE("Reaped child {} with status {:#x}", pid_, res.status);

    return res.status;
}

void Subprocess::close_fds() noexcept {
    for (int* fd : {&stdout_fd_, &stderr_fd_}) {
        if (*fd != -1) {
            std::ignore = linux::close(*fd);
            *fd = -1;
        }
    }
}

} // namespace polygrader
