#pragma once

#include <exegrader/common/expected.hpp>
#include <exegrader/common/formatters/enum.hpp>

#include <boost/describe/enum.hpp>
#include <boost/preprocessor/cat.hpp>

namespace exegrader {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,            ///< Program / operation surpassed its timeout
    CommandNotFound,     ///< The executable of a command could not be located
    CannotExecute,       ///< The executable was found, but exec failed (e.g., permissions)
    UnsupportedLanguage, ///< No language profile is registered for the requested id
    ExerciseNotFound,    ///< The exercise store has no exercise with the requested id
    NoTestsConfigured,   ///< An exercise exists, but has no test cases
    IoFailure,           ///< Reading or writing a file failed
    SyscallFailure,      ///< A Linux syscall failed
    UnknownError,        ///< As named; use this as little as possible

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

BOOST_DESCRIBE_ENUM(ErrorKind, TimedOut, CommandNotFound, CannotExecute, UnsupportedLanguage, ExerciseNotFound,
                    NoTestsConfigured, IoFailure, SyscallFailure, UnknownError, MaxErrorNum)

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace exegrader

/// If the supplied argument is an error (unexpected) type, then propagate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::exegrader::ErrorKind;                                                                         \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propagate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
