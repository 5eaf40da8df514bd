#pragma once

#include <polygrader/common/class_traits.hpp>
#include <polygrader/common/error_types.hpp>

#include <atomic>
#include <optional>
#include <stop_token>
#include <thread>

#include <signal.h>

namespace polygrader {

/// Turns SIGINT and SIGTERM into a stop request.
///
/// The signals are blocked in the thread that calls `start`, and in every thread it creates
/// afterwards; a dedicated thread waits for them synchronously. `start` must therefore be
/// called before any worker thread exists.
class InterruptWatcher : NonMovable
{
public:
    InterruptWatcher();

    /// Stops watching and restores the signal mask
    ~InterruptWatcher();

    Result<void> start();

    /// Requested as soon as one of the signals arrives
    std::stop_token get_token() const noexcept { return stop_source_.get_token(); }

    /// The first signal received, if any
    std::optional<int> received_signal() const noexcept;

private:
    void watch(std::stop_token self_token);

    sigset_t signals_{};
    std::optional<sigset_t> old_mask_;

    std::stop_source stop_source_;
    std::atomic<int> received_signal_{0};

    std::jthread thread_;
};

} // namespace polygrader
