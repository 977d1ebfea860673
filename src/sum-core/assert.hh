#pragma once

// Lean header with minimal dependencies, safe to include from every container header.
// For formatted messages (payload renderings etc.) use <sum-core/assertf.hh> instead.
#include <sum-core/macros.hh>
#include <sum-core/source_location.hh>

// =========================================================================================================
// SC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
// Active in debug and relwithdebinfo builds (see SC_ASSERT_ENABLED in macros.hh).
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS.
//   In sum-core they report contract violations: extracting a payload from the variant that does not hold it.
//
// What assertions are NOT for:
//   - NOT for user input validation
//   - NOT for common/expected error conditions, those are sc::result<T, E> failures
//
// Error handling strategy:
//   - Assertions      -> programmer errors, e.g. unwrap() on an absent option
//   - result<T, E>    -> common/expected error handling, failures are plain data
//
// Important:
//   A failed assertion is semantically equivalent to std::terminate().
//   Installed handlers (see assert-handler.hh) may throw to unwind to a recovery point instead.
//
// Usage:
//   SC_ASSERT(ptr != nullptr, "pointer must not be null");
//   SC_ASSERT(self._has_value, "attempted to access value of absent option");
//
#define SC_ASSERT(cond, msg) SC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// SC_ASSERT_ALWAYS - Always-active assertion
//
// Like SC_ASSERT but remains active in all build configurations, including release builds.
// The value extractors (unwrap, expect, ...) use this: their failure must never be silently skipped.
//
#define SC_ASSERT_ALWAYS(cond, msg) SC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// SC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define SC_DEBUG_BREAK() SC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// SC_BREAK_AND_ABORT - Debug break followed by program termination
//
#define SC_BREAK_AND_ABORT() (SC_DEBUG_BREAK(), ::sc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace sc::impl
{
// Called when an assertion fails
// Dispatches to the topmost installed handler or prints diagnostics to stderr
// Note: does not abort, caller must follow with SC_BREAK_AND_ABORT()
SC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, sc::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace sc::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef SC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define SC_IMPL_DEBUG_BREAK() (::sc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(SC_COMPILER_POSIX)

// SIGTRAP (5) signals a breakpoint to an attached debugger
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define SC_IMPL_DEBUG_BREAK() (::sc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define SC_IMPL_DEBUG_BREAK() void(0)

#endif

#define SC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::sc::impl::handle_assert_failure(#cond, msg, ::sc::source_location::current()); \
            SC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if SC_ASSERT_ENABLED

#define SC_IMPL_ASSERT(cond, msg) SC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message still have to compile
#define SC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        SC_UNUSED(cond);          \
        SC_UNUSED(msg);           \
    } while (false)

#endif
