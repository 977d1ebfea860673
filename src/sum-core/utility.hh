#pragma once

#include <sum-core/fwd.hh>
#include <sum-core/macros.hh>

#include <functional>
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//
// Invocation:
//   invoke(f, args...)          - call f with args (callables, member function and member object pointers)
//   invoke_result<F, Args...>   - type returned by invoke(f, args...)
//
// Object lifetime:
//   placement_new               - tag for header-light placement new: new (sc::placement_new, ptr) T(...)
//   storage_for<T>              - uninitialized storage with size and alignment of T
//

namespace sc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   T b = sc::move(a);              // move construct b from a
///   return sc::move(*this);         // hand out the contained payload from an rvalue container
template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] SC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Invocation
// =========================================================================================================

/// Calls f with the given arguments
/// Supports plain callables as well as member function pointers and member object pointers
/// (object given as reference, pointer, or reference_wrapper)
/// Return type is preserved exactly, including references (decltype(auto))
/// Usage:
///   sc::invoke(f, 1, 2);
///   sc::invoke(&S::method, s, 3);
///   option.map(&S::value);           // combinators accept member pointers via invoke
template <class F, class... Args>
constexpr decltype(auto) invoke(F&& f, Args&&... args) noexcept(std::is_nothrow_invocable_v<F, Args...>)
{
    return std::invoke(sc::forward<F>(f), sc::forward<Args>(args)...);
}

/// Type of sc::invoke(F, Args...)
template <class F, class... Args>
using invoke_result = std::invoke_result_t<F, Args...>;

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag type selecting the sum-core placement new overload below
/// Avoids pulling in <new> in every header
struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};

/// Uninitialized storage for exactly one T
/// The owner decides when `value` is alive, constructs it with placement new and destroys it explicitly
/// Trivially copyable / destructible when T is, so containers built on it can stay trivial
template <class T>
union storage_for
{
    char _dummy;
    T value;

    constexpr storage_for() : _dummy() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

} // namespace sc

[[nodiscard]] SC_FORCE_INLINE void* operator new(std::size_t, sc::placement_new_t, void* ptr) noexcept
{
    return ptr;
}
SC_FORCE_INLINE void operator delete(void*, sc::placement_new_t, void*) noexcept {}
