#pragma once

#include <sum-core/macros.hh>
#include <sum-core/source_location.hh>

#include <cstddef>
#include <functional>
#include <string>

namespace sc::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = sc::impl::scoped_assertion_handler([](sc::impl::assertion_info const& info) {
//           log_contract_violation(info);
//           throw contract_violation{info.message};
//       });
//
//       // unwrap() on an absent option now throws instead of aborting
//       auto v = maybe_value.unwrap();
//   } // handler is automatically popped here

// A single contract violation, e.g. unwrap() on a failed result
// expression is the stringified condition, message the rendered payload or user message
struct assertion_info
{
    std::string expression;
    std::string message;
    sc::source_location location;

    // multi-line report as printed by the default handler (without stacktrace)
    [[nodiscard]] std::string to_string() const;
};

// Push a custom assertion handler onto the handler stack
// The handler will be called for all assertion failures until it is popped
// Handlers are allowed to throw exceptions as a way to unwind to some recovery point
// If a handler returns normally, the program is aborted
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// NOTE: prefer scoped_assertion_handler, it pops even if a handler throws
void pop_assertion_handler();

// Number of currently installed handlers, 0 means failures go to the default handler
[[nodiscard]] std::size_t assertion_handler_count();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace sc::impl
