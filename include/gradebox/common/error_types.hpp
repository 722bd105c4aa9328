#pragma once

#include <gradebox/common/expected.hpp>
#include <gradebox/common/formatters.hpp>

#include <boost/describe/enum.hpp>
#include <boost/preprocessor/cat.hpp>

namespace gradebox {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,         ///< Process / operation surpassed its deadline
    SyscallFailure,   ///< A Linux syscall failed in the harness process
    SpawnFailure,     ///< The child could not exec the requested program
    SandboxFailure,   ///< The child could not assume the restricted identity or limits
    NotFound,         ///< A user, file, or executable could not be located
    PermissionDenied, ///< The harness lacks the privilege for an operation
    IoFailure,        ///< Reading or writing a file failed
    UnknownError,     ///< As named; use this as little as possible
};

BOOST_DESCRIBE_ENUM(ErrorKind, TimedOut, SyscallFailure, SpawnFailure, SandboxFailure, NotFound, PermissionDenied,
                    IoFailure, UnknownError);

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace gradebox

/// If the supplied argument is an error (unexpected) type, then propagate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::gradebox::ErrorKind;                                                                          \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propagate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errref_uniq__, __COUNTER__))
