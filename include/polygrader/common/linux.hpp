#pragma once

#include <polygrader/common/expected.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

/// Thin wrappers around the Linux syscalls used by the process layer.
/// Every wrapper reports failure as a std::error_code and logs it at debug level.
/// None of them may be called in a freshly forked child of a multi-threaded parent.
namespace polygrader::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// reads up to ``count`` bytes from a file descriptor. See read(2)
/// An empty string signals EOF. EAGAIN is reported as an error like any other.
inline Expected<std::string> read(int fd, std::size_t count) {
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        if (err != std::errc::resource_unavailable_try_again) {
            LOG_DEBUG("read failed: '{}'", err.message());
        }
        return err;
    }

    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// Sends ``sig`` to every process in the process group ``pgid``. See killpg(3)
inline Expected<> killpg(pid_t pgid, int sig) {
    int res = ::killpg(pgid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("killpg({}, {}) failed: '{}'", pgid, sig, err.message());
        return err;
    }

    return {};
}

/// see setpgid(2)
inline Expected<> setpgid(pid_t pid, pid_t pgid) {
    int res = ::setpgid(pid, pgid);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setpgid({}, {}) failed: '{}'", pid, pgid, err.message());
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see fcntl(2)
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());

        return err;
    }

    return res;
}

/// see poll(2)
/// EINTR is not treated as an error; 0 ready descriptors are reported instead.
inline Expected<int> poll(std::span<pollfd> fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        if (errno == EINTR) {
            return 0;
        }

        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err.message());

        return err;
    }

    return res;
}

struct WaitStatus
{
    pid_t pid; ///< 0 if WNOHANG was given and the child has not changed state
    int status;
    struct rusage usage;
};

/// see wait4(2)
inline Expected<WaitStatus> wait4(pid_t pid, int options = 0) {
    WaitStatus result{};

    pid_t res = 0;
    do {
        res = ::wait4(pid, &result.status, options, &result.usage);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("wait4 failed: '{}'", err.message());

        return err;
    }

    result.pid = res;

    return result;
}

/// see waitid(2)
/// With WNOHANG, a child that has not changed state is reported with ``si_pid == 0``.
inline Expected<siginfo_t> waitid(idtype_t idtype, id_t id, int options) {
    siginfo_t info{};

    int res = 0;
    do {
        res = ::waitid(idtype, id, &info, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitid failed: '{}'", err.message());

        return err;
    }

    return info;
}

/// Changes the signal mask of the calling thread, returning the previous one. See pthread_sigmask(3)
inline Expected<sigset_t> pthread_sigmask(int how, const sigset_t& set) {
    sigset_t old_set{};

    // pthread_sigmask reports errors through its return value, not errno
    int res = ::pthread_sigmask(how, &set, &old_set);

    if (res != 0) {
        auto err = make_error_code(res);

        LOG_DEBUG("pthread_sigmask failed: '{}'", err.message());

        return err;
    }

    return old_set;
}

/// Waits up to ``timeout`` for one of ``set`` to be pending. See sigtimedwait(2)
/// Running out of time, or being interrupted, yields ``std::nullopt``.
inline Expected<std::optional<int>> sigtimedwait(const sigset_t& set, const timespec& timeout) {
    int res = ::sigtimedwait(&set, nullptr, &timeout);

    if (res == -1) {
        if (errno == EAGAIN || errno == EINTR) {
            return std::optional<int>{};
        }

        auto err = make_error_code(errno);

        LOG_DEBUG("sigtimedwait failed: '{}'", err.message());

        return err;
    }

    return std::optional<int>{res};
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err.message());

        return err;
    }

    return pipe;
}

/// Creates a uniquely named directory from ``templ``, which must end in "XXXXXX". See mkdtemp(3)
inline Expected<std::string> mkdtemp(std::string templ) {
    if (::mkdtemp(templ.data()) == nullptr) {
        auto err = make_error_code(errno);

        LOG_DEBUG("mkdtemp('{}') failed: '{}'", templ, err.message());

        return err;
    }

    return templ;
}

/// Value type to behave as a linux signal
class Signal
{
public:
    explicit Signal(int signal_num)
        : signal_num_{signal_num} {}

    int number() const { return signal_num_; }

    /// Abbreviated name, e.g. "SEGV"
    std::string name() const {
        const char* abbrev = sigabbrev_np(signal_num_);
        return abbrev != nullptr ? abbrev : fmt::format("{}", signal_num_);
    }

    /// Human readable description, e.g. "Segmentation fault"
    std::string description() const {
        const char* descr = sigdescr_np(signal_num_);
        return descr != nullptr ? descr : "Unknown signal";
    }

    std::string to_string() const { return fmt::format("SIG{} ({})", name(), description()); }

private:
    int signal_num_;
};

} // namespace polygrader::linux

template <>
struct fmt::formatter<::polygrader::linux::Signal> : fmt::formatter<std::string_view>
{
    auto format(const ::polygrader::linux::Signal& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(from.to_string(), ctx);
    }
};
