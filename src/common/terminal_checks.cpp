#include "common/terminal_checks.hpp"

#include <polygrader/common/expected.hpp>
#include <polygrader/common/linux.hpp>

#include <range/v3/algorithm/any_of.hpp>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <sys/ioctl.h>
#include <unistd.h>

namespace polygrader {

// Determine if the terminal supports colors
// Based on: https://github.com/gabime/spdlog
// Which is subsequently based on: https://github.com/agauniyal/rang/
bool is_color_terminal() noexcept {
    static const bool RESULT = []() {
        if (std::getenv("NO_COLOR") != nullptr) {
            return false;
        }

        if (std::getenv("COLORTERM") != nullptr) {
            return true;
        }

        static constexpr std::array<const char*, 16> TERMS = {{"ansi", "color", "console", "cygwin", "gnome", "konsole",
                                                               "kterm", "linux", "msys", "putty", "rxvt", "screen",
                                                               "vt100", "xterm", "alacritty", "vt102"}};

        const char* env_term_p = std::getenv("TERM");

        if (env_term_p == nullptr) {
            return false;
        }

        return ranges::any_of(TERMS, [&](const char* term) { return std::strstr(env_term_p, term) != nullptr; });
    }();

    return RESULT;
}

bool in_terminal(FILE* file) noexcept {
    return ::isatty(fileno(file)) != 0;
}

Expected<winsize> terminal_size(FILE* file) noexcept {
    winsize size{};

    // NOLINTNEXTLINE(*vararg)
    if (::ioctl(fileno(file), TIOCGWINSZ, &size) == -1) {
        return linux::make_error_code(errno);
    }

    return size;
}

} // namespace polygrader
