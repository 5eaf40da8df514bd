#pragma once

#include <polygrader/common/expected.hpp>
#include <polygrader/common/formatters/enum.hpp>

#include <boost/preprocessor/cat.hpp>

namespace polygrader {

/// Failures of the grading environment itself. Problems with a student's code
/// (compile errors, crashes, timeouts) are never reported through this type.
// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,              ///< An internal operation surpassed its timeout
    SyscallFailure,        ///< A Linux syscall failed
    ToolchainMissing,      ///< The compiler or interpreter binary for a language is not installed
    ExecFailure,           ///< The child process could not be set up or exec'd
    WorkspaceFailure,      ///< The isolated working directory could not be created or populated
    SubmissionUnavailable, ///< A group's hand-in could not be read from disk
    Cancelled,             ///< Evaluation was aborted by the operator
    InvalidConfig,         ///< Configuration values are unusable
    UnknownError,          ///< As named; use this as little as possible
};

POLYGRADER_ENUM_NAMES(ErrorKind, TimedOut, SyscallFailure, ToolchainMissing, ExecFailure, WorkspaceFailure,
                      SubmissionUnavailable, Cancelled, InvalidConfig, UnknownError);

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace polygrader

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::polygrader::ErrorKind;                                                                        \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
