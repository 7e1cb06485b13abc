#pragma once

// Lean header with minimal dependencies: safe to include from the cell headers and from freestanding code.
#include <late-core/macros.hh>
#include <late-core/source_location.hh>

// =========================================================================================================
// LC_ASSERT - Contract check with string literal message
//
// Validates a condition at runtime and reports + aborts on failure.
//
// When assertions are active:
//   Controlled by the single predicate LC_ASSERT_ENABLED (see macros.hh).
//   Enabled in LC_DEBUG and LC_RELWITHDEBINFO builds, or when LC_ENABLE_ASSERT_IN_RELEASE is defined.
//   When disabled, the condition is not evaluated.
//
// What assertions are for:
//   Assertions protect the usage contracts of late-core types:
//   initializing a checked_cell twice, reading a checked_cell before it was written, ...
//   These are PROGRAMMER ERRORS, never runtime conditions.
//
// Error handling strategy:
//   - Assertions         -> contract violations (double initialize, read before write)
//   - optional<T&>       -> legitimate uncertainty (checked_cell::try_get_reference)
//   - nothing            -> unchecked_cell, where violations are plain undefined behavior
//
// Usage:
//   LC_ASSERT(!is_initialized(), "checked_cell initialized twice");
//
#define LC_ASSERT(cond, msg) LC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// LC_ASSERT_ALWAYS - Always-active contract check
//
// Like LC_ASSERT but remains active in all build configurations, including release builds.
//
// Usage:
//   LC_ASSERT_ALWAYS(config.is_initialized(), "boot configuration was never loaded");
//
#define LC_ASSERT_ALWAYS(cond, msg) LC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// LC_ASSERT_UNREACHABLE - Contract violation on a path that must never execute
//
// With LC_ASSERT_ENABLED: reports to the assertion handler and aborts.
// Without:                expands to LC_BUILTIN_UNREACHABLE, the optimizer assumes the path is dead.
//
// Both variants share the LC_ASSERT_ENABLED predicate with LC_ASSERT,
// so forcing LC_ASSERT_ENABLED (e.g. in tests) always selects the reporting path for both.
//
// Usage:
//   if (!_inner.has_value())
//       LC_ASSERT_UNREACHABLE("accessed checked_cell before initialization");
//
#define LC_ASSERT_UNREACHABLE(msg) LC_IMPL_ASSERT_UNREACHABLE(msg)

// =========================================================================================================
// LC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
// Executes inline (not in a function) so the debugger stops at the violating line.
//
#define LC_DEBUG_BREAK() LC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// LC_BREAK_AND_ABORT - Debug break followed by program termination
//
// Used by all assertion macros after the handler returns.
//
#define LC_BREAK_AND_ABORT() (LC_DEBUG_BREAK(), ::lc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace lc::impl
{
// Called when an assertion fails
// Forwards to the topmost assertion handler (see assert-handler.hh) or prints to stderr
// Note: does not abort, caller must follow with LC_BREAK_AND_ABORT()
LC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, lc::source_location location);

// Checks if a debugger is currently attached to the process
// Always false outside of Linux
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace lc::impl

// Debugger break, inline in the macro so the debugger stops at the violated check.
// Only Linux can detect an attached debugger (TracerPid), elsewhere this is a no-op.

#ifdef LC_OS_LINUX

// SIGTRAP is 5 on Linux, declared here to keep <csignal> out of every cell header
extern "C" int raise(int) noexcept;
#define LC_IMPL_DEBUG_BREAK() (::lc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define LC_IMPL_DEBUG_BREAK() void(0)

#endif

// LC_ASSERT_ALWAYS implementation - always enabled regardless of build configuration
#define LC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::lc::impl::handle_assert_failure(#cond, msg, ::lc::source_location::current()); \
            LC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if LC_ASSERT_ENABLED

#define LC_IMPL_ASSERT(cond, msg) LC_IMPL_ASSERT_ALWAYS(cond, msg)

#define LC_IMPL_ASSERT_UNREACHABLE(msg)                                                         \
    do                                                                                          \
    {                                                                                           \
        ::lc::impl::handle_assert_failure("unreachable", msg, ::lc::source_location::current()); \
        LC_BREAK_AND_ABORT();                                                                   \
    } while (false)

#else

// Stripped: neither condition nor message are evaluated, but both must still compile
#define LC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        LC_UNUSED(cond);          \
        LC_UNUSED(msg);           \
    } while (false)

#define LC_IMPL_ASSERT_UNREACHABLE(msg) \
    do                                  \
    {                                   \
        LC_UNUSED(msg);                 \
        LC_BUILTIN_UNREACHABLE;         \
    } while (false)

#endif
