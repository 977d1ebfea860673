#pragma once

#include <sum-core/assert.hh>

#include <format>
#include <string>

// =========================================================================================================
// SC_ASSERTF_ALWAYS - Always-active assertion with formatted message
//
// SC_ASSERT_ALWAYS with std::format-style arguments, active in every build configuration.
// Arguments are only evaluated when the condition fails.
//
// Usage:
//   SC_ASSERTF_ALWAYS(self.is_success(), "{}: {}", message, sc::to_debug_string(self.error()));
//
#define SC_ASSERTF_ALWAYS(cond, msg, ...) SC_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define SC_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::sc::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::sc::source_location::current());                          \
            SC_BREAK_AND_ABORT();                                                                         \
        }                                                                                                 \
    } while (false)
