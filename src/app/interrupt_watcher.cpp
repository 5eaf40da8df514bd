#include "app/interrupt_watcher.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/common/linux.hpp>
#include <polygrader/logging.hpp>

#include <chrono>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>

#include <signal.h>
#include <time.h>

namespace polygrader {

namespace {

constexpr timespec POLL_INTERVAL{.tv_sec = 0, .tv_nsec = 100'000'000};

} // namespace

InterruptWatcher::InterruptWatcher() {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
}

InterruptWatcher::~InterruptWatcher() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }

    if (old_mask_) {
        if (auto res = linux::pthread_sigmask(SIG_SETMASK, *old_mask_); !res) {
            LOG_WARN("Could not restore the signal mask: {}", res.error().message());
        }
    }
}

Result<void> InterruptWatcher::start() {
    old_mask_ = TRYE(linux::pthread_sigmask(SIG_BLOCK, signals_), SyscallFailure);

    thread_ = std::jthread{[this](std::stop_token self_token) { watch(std::move(self_token)); }};

    return {};
}

std::optional<int> InterruptWatcher::received_signal() const noexcept {
    int sig = received_signal_.load();

    if (sig == 0) {
        return std::nullopt;
    }

    return sig;
}

void InterruptWatcher::watch(std::stop_token self_token) {
    while (!self_token.stop_requested()) {
        auto res = linux::sigtimedwait(signals_, POLL_INTERVAL);

        if (!res) {
            LOG_ERROR("Waiting for interrupts failed ({}); interrupts are no longer handled",
                      res.error().message());
            return;
        }

        if (!res.value()) {
            continue;
        }

        const int sig = *res.value();

        if (stop_source_.stop_requested()) {
            LOG_WARN("Received {} while already aborting", linux::Signal{sig});
            continue;
        }

        LOG_WARN("Received {}; aborting. Running submissions are killed.", linux::Signal{sig});

        received_signal_ = sig;
        stop_source_.request_stop();
    }
}

} // namespace polygrader
