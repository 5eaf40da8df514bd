#pragma once

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <polygrader/common/class_traits.hpp>

#include <optional>
#include <utility>

namespace polygrader {

class App : NonCopyable
{
public:
    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    /// Exit status of the run. Escaped exceptions are traced and reported as ``EXCEPTION_EXIT_CODE``.
    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(EXCEPTION_EXIT_CODE);
    }

    static constexpr int EXCEPTION_EXIT_CODE = 3;

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;
};

} // namespace polygrader
