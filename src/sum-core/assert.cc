#include "assert.hh"

#include <sum-core/assert-handler.hh>
#include <sum-core/stacktrace.hh>

#include <cstdio>
#include <cstdlib>
#include <format>
#include <iostream>
#include <utility>
#include <vector>

#ifdef SC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef SC_OS_LINUX
#include <cstring>
#endif

namespace
{
// Global stack of assertion handlers
// NOTE: This is not thread-safe and must be externally synchronized
std::vector<std::move_only_function<void(sc::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(sc::impl::assertion_info const& info)
{
    // skip this frame and handle_assert_failure
    auto const trace = sc::stacktrace::current(2);
    std::cerr << info.to_string() << "\nStacktrace:\n" << std::to_string(trace) << '\n';
}
} // namespace

std::string sc::impl::assertion_info::to_string() const
{
    return std::format("Assertion failed: {}\n  Message: {}\n  Location: {}:{}:{} ({})\n", expression, message,
                       location.file_name(), location.line(), location.column(), location.function_name());
}

void sc::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void sc::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

std::size_t sc::impl::assertion_handler_count()
{
    return g_assertion_handlers.size();
}

sc::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

sc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

SC_COLD_FUNC void sc::impl::handle_assert_failure(char const* expression, char const* message, sc::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

bool sc::impl::is_debugger_connected() noexcept
{
#ifdef SC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(SC_OS_LINUX)
    // TracerPid in /proc/self/status is non-zero while a debugger is attached
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                std::sscanf(buf + 10, "%d", &pid);
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void sc::impl::perform_abort() noexcept
{
    std::abort();
}
