#include "catch2_custom.hpp"

#include "common/which.hpp"
#include "subprocess/run_result.hpp"
#include "subprocess/subprocess.hpp"
#include "test_helpers.hpp"

#include <polygrader/common/error_types.hpp>
#include <polygrader/logging.hpp>

#include <fmt/format.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace polygrader;
using namespace std::chrono_literals;

namespace {

/// `/bin/sh -c script`, started in the temp directory
struct ShellProcess
{
    explicit ShellProcess(const std::string& script)
        : proc{"/bin/sh", {"sh", "-c", script}, std::filesystem::temp_directory_path()} {}

    Subprocess proc;
};

/// Whether ``pid`` is gone (or a zombie waiting for someone else to reap it)
bool is_dead(pid_t pid) {
    std::ifstream stat{fmt::format("/proc/{}/stat", pid)};

    if (!stat.is_open()) {
        return true;
    }

    std::string line;
    std::getline(stat, line);

    // State follows the parenthesized command name
    auto state_pos = line.rfind(')');
    return state_pos == std::string::npos || state_pos + 2 >= line.size() || line[state_pos + 2] == 'Z';
}

} // namespace

TEST_CASE("Capture stdout of a short program") {
    ShellProcess shell{"printf 'Hello world!'"};

    REQUIRE(shell.proc.start({}));

    auto res = shell.proc.wait_for_exit();

    REQUIRE(res);
    REQUIRE(res->get_kind() == RunResult::Kind::Exited);
    REQUIRE(res->get_exit_code() == 0);
    REQUIRE(shell.proc.get_stdout().data == "Hello world!");
    REQUIRE(shell.proc.get_stderr().empty());
}

TEST_CASE("Exit codes and stderr are reported") {
    ShellProcess shell{"echo oops >&2; exit 3"};

    REQUIRE(shell.proc.start({}));

    auto res = shell.proc.wait_for_exit();

    REQUIRE(res);
    REQUIRE(res->get_exit_code() == 3);
    REQUIRE_FALSE(res->get_signal());
    REQUIRE(shell.proc.get_stderr().data == "oops\n");
}

TEST_CASE("Fatal signals are reported") {
    ShellProcess shell{"kill -SEGV $$"};

    REQUIRE(shell.proc.start({}));

    auto res = shell.proc.wait_for_exit();

    REQUIRE(res);
    REQUIRE(res->get_kind() == RunResult::Kind::Signaled);
    REQUIRE(res->get_signal() == SIGSEGV);
    REQUIRE_FALSE(res->get_exit_code());
}

TEST_CASE("SIGXCPU before the deadline is a fatal signal, not a timeout") {
    ShellProcess shell{"kill -XCPU $$"};

    REQUIRE(shell.proc.start({.wall_timeout = 10s}));

    auto res = shell.proc.wait_for_exit();

    REQUIRE(res);
    REQUIRE(res->get_kind() == RunResult::Kind::Signaled);
    REQUIRE(res->get_signal() == SIGXCPU);
}

TEST_CASE("CPU time backstop scales with the number of cores") {
    REQUIRE(cpu_time_backstop(10s, 1) == 12s);
    REQUIRE(cpu_time_backstop(10s, 4) == 42s);
    REQUIRE(cpu_time_backstop(1500ms, 2) == 6s);

    // An unknown core count counts as one
    REQUIRE(cpu_time_backstop(10s, 0) == 12s);

    // Four threads spinning through the whole deadline stay under the limit
    REQUIRE(cpu_time_backstop(10s, 4) > 4 * 10s);
}

TEST_CASE("Stdin is empty and the working directory is honored") {
    const auto dir = std::filesystem::canonical(std::filesystem::temp_directory_path());
    Subprocess proc{"/bin/sh", {"sh", "-c", "cat; pwd -P"}, dir};

    REQUIRE(proc.start({}));

    auto res = proc.wait_for_exit();

    REQUIRE(res);
    REQUIRE(res->get_exit_code() == 0);
    REQUIRE(proc.get_stdout().data == dir.string() + "\n");
}

TEST_CASE("Programs are killed at their deadline") {
    ShellProcess shell{"sleep 30"};

    const auto start = std::chrono::steady_clock::now();

    REQUIRE(shell.proc.start({.wall_timeout = 200ms}));

    auto res = shell.proc.wait_for_exit();

    REQUIRE(res);
    REQUIRE(res->get_kind() == RunResult::Kind::TimedOut);
    REQUIRE_FALSE(res->get_exit_code());
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    REQUIRE_FALSE(shell.proc.is_alive());
}

TEST_CASE("Killing a program kills everything it spawned") {
    // The background sleep keeps the output pipe open, and would outlive the shell
    ShellProcess shell{"sleep 30 & echo $!; wait"};

    REQUIRE(shell.proc.start({.wall_timeout = 300ms}));

    auto res = shell.proc.wait_for_exit();

    REQUIRE(res);
    REQUIRE(res->get_kind() == RunResult::Kind::TimedOut);

    const std::string& out = shell.proc.get_stdout().data;
    REQUIRE_FALSE(out.empty());

    const auto grandchild = static_cast<pid_t>(std::stol(out));

    // Reaping of the orphan by init is asynchronous
    bool dead = false;
    for (int attempt = 0; attempt < 100 && !dead; ++attempt) {
        dead = is_dead(grandchild);
        if (!dead) {
            std::this_thread::sleep_for(10ms);
        }
    }

    REQUIRE(dead);
}

TEST_CASE("Output is truncated at the cap, but fully consumed") {
    ShellProcess shell{"head -c 100000 /dev/zero; echo done >&2"};

    REQUIRE(shell.proc.start({.output_cap_bytes = 1000}));

    auto res = shell.proc.wait_for_exit();

    REQUIRE(res);
    REQUIRE(res->get_exit_code() == 0);

    const CapturedOutput& out = shell.proc.get_stdout();
    REQUIRE(out.truncated);
    REQUIRE(out.data.size() == 1000);
    REQUIRE(out.total_bytes == 100000);

    REQUIRE_FALSE(shell.proc.get_stderr().truncated);
    REQUIRE(shell.proc.get_stderr().data == "done\n");
}

TEST_CASE("A stop request cancels the run") {
    ShellProcess shell{"sleep 30"};
    std::stop_source stop_source;

    REQUIRE(shell.proc.start({.wall_timeout = 20s}));

    std::jthread stopper{[&stop_source] {
        std::this_thread::sleep_for(100ms);
        stop_source.request_stop();
    }};

    const auto start = std::chrono::steady_clock::now();
    auto res = shell.proc.wait_for_exit(stop_source.get_token());

    REQUIRE(res == ErrorKind::Cancelled);
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    REQUIRE_FALSE(shell.proc.is_alive());
}

TEST_CASE("Programs that cannot be executed fail to start") {
    Subprocess proc{"/polygrader/no/such/program", {"program"}, std::filesystem::temp_directory_path()};

    REQUIRE(proc.start({}) == ErrorKind::ExecFailure);
    REQUIRE_FALSE(proc.is_alive());
}

TEST_CASE("A missing working directory fails to start") {
    Subprocess proc{"/bin/sh", {"sh", "-c", "true"}, "/polygrader/no/such/dir"};

    REQUIRE(proc.start({}) == ErrorKind::ExecFailure);
}

TEST_CASE("Memory ceiling is enforced by sampling") {
    if (!test::has_command("python3")) {
        SKIP("python3 is not installed");
    }

    Subprocess proc{*which("python3"),
                    {"python3", "-c", "import time\nx = b'a' * (256 * 1024 * 1024)\ntime.sleep(5)"},
                    std::filesystem::temp_directory_path()};

    REQUIRE(proc.start({.wall_timeout = 10s, .memory_limit_kb = 64 * 1024, .limit_address_space = false}));

    auto res = proc.wait_for_exit();

    REQUIRE(res);
    REQUIRE(res->get_kind() == RunResult::Kind::MemoryExceeded);
    REQUIRE(res->get_usage().peak_memory_kb > 64 * 1024);
    REQUIRE(res->get_usage().wall_time < 5s);
}
