#pragma once

#include <sum-core/assert.hh>
#include <sum-core/assertf.hh>
#include <sum-core/fwd.hh>
#include <sum-core/option.hh>
#include <sum-core/source_location.hh>
#include <sum-core/to_debug_string.hh>
#include <sum-core/utility.hh>

#include <memory>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>

// =========================================================================================================
// sc::result<T, E> - Success(value: T) or Failure(error: E)
// =========================================================================================================
//
// Construction:
//   sc::result<int, std::string> r = 5;                       // success
//   sc::result<int, std::string> r = sc::success(5);          // success, explicit
//   sc::result<int, std::string> r = sc::failure("bad");      // failure
//   sc::result<int> r = sc::failure(sc::any_error("bad"));   // default error type is sc::any_error
//
// There is no default constructor and no empty state.
// Failures are plain data: only unwrap, unwrap_err, expect and expect_err raise contract violations.
//
// Error widening:
//   and_, and_then and combine may mix error types. The resulting error type is
//   sc::error_union<E, F, ...>: one type stays as is, several become a std::variant.
//

/// Uninhabited type: result<T, never> can only be a success, result<never, E> only a failure.
struct sc::never
{
    never() = delete;

    [[nodiscard]] friend constexpr bool operator==(never const&, never const&) { return true; }
};

/// Construction tag for the success variant: sc::success(value)
template <class T>
struct sc::success_t
{
    T value;
};

/// Construction tag for the failure variant: sc::failure(error)
template <class E>
struct sc::failure_t
{
    E error;
};

namespace sc
{
/// Wraps a value for constructing a successful result.
/// Arguments decay, so sc::success("abc") holds a char const*.
template <class T>
[[nodiscard]] constexpr success_t<std::decay_t<T>> success(T&& value)
{
    return {sc::forward<T>(value)};
}

/// Wraps an error for constructing a failed result.
template <class E>
[[nodiscard]] constexpr failure_t<std::decay_t<E>> failure(E&& error)
{
    return {sc::forward<E>(error)};
}
} // namespace sc

/// Type-erased default error of sc::result<T>
/// Carries a message, the source location it was raised at and a chain of context notes.
/// Default constructed any_error is empty and renders as "<empty sc::any_error>".
///
/// Usage:
///   sc::result<config> load(std::string_view path)
///   {
///       auto text = read_file(path);
///       if (text.is_failure())
///           return sc::failure(sc::any_error("cannot read config"));
///       return parse(text.unwrap()).with_context("while parsing config");
///   }
struct sc::any_error
{
    // construction
public:
    any_error() = default;
    any_error(std::string message, sc::source_location site = sc::source_location::current());
    any_error(char const* message, sc::source_location site = sc::source_location::current());

    any_error(any_error const& rhs);
    any_error& operator=(any_error const& rhs);
    any_error(any_error&& rhs) noexcept;
    any_error& operator=(any_error&& rhs) noexcept;
    ~any_error();

    // queries
public:
    [[nodiscard]] bool is_empty() const;

    /// Message of the original error, empty for an empty any_error
    [[nodiscard]] std::string_view message() const;

    /// Where the error was raised
    [[nodiscard]] sc::source_location site() const;

    /// Number of context notes added so far
    [[nodiscard]] isize context_count() const;

    /// Multi-line rendering: message, site and all context notes (newest first)
    [[nodiscard]] std::string to_string() const;

    // context
public:
    /// Adds a context note describing what was being attempted when the error occurred
    any_error& add_context(std::string message, sc::source_location site = sc::source_location::current()) &;

    [[nodiscard]] any_error with_context(std::string message, sc::source_location site = sc::source_location::current()) &&;

    [[nodiscard]] friend bool operator==(any_error const& lhs, any_error const& rhs)
    {
        return lhs.is_empty() == rhs.is_empty() && lhs.message() == rhs.message();
    }

    // members
private:
    struct context_node;
    struct payload;

    std::unique_ptr<payload> _payload;

    void impl_ensure_payload();
    // drops the context chain node by node, keeps stack depth constant for long chains
    void impl_release_chain() noexcept;
};

// =========================================================================================================
// Error union
// =========================================================================================================

namespace sc
{
namespace impl
{
template <class... Ts>
struct type_list
{
};

template <class List, class... Es>
struct error_union_fold;

// adds E unless it is already present or never; std::variant alternatives are added one by one
template <class List, class E>
struct error_union_add;
template <class... Ts, class E>
struct error_union_add<type_list<Ts...>, E>
{
    using type = std::conditional_t<(std::is_same_v<E, Ts> || ...) || std::is_same_v<E, never>, type_list<Ts...>, type_list<Ts..., E>>;
};
template <class... Ts, class... Vs>
struct error_union_add<type_list<Ts...>, std::variant<Vs...>>
{
    using type = typename error_union_fold<type_list<Ts...>, Vs...>::type;
};

template <class List>
struct error_union_fold<List>
{
    using type = List;
};
template <class List, class E, class... Es>
struct error_union_fold<List, E, Es...>
{
    using type = typename error_union_fold<typename error_union_add<List, std::remove_cv_t<E>>::type, Es...>::type;
};

template <class List>
struct error_union_make;
template <>
struct error_union_make<type_list<>>
{
    using type = never;
};
template <class E>
struct error_union_make<type_list<E>>
{
    using type = E;
};
template <class E0, class E1, class... Es>
struct error_union_make<type_list<E0, E1, Es...>>
{
    using type = std::variant<E0, E1, Es...>;
};
} // namespace impl

/// Union of error types
///   error_union<E>                      -> E
///   error_union<E, E>                   -> E
///   error_union<E, F>                   -> std::variant<E, F>
///   error_union<E, never>               -> E
///   error_union<std::variant<E, F>, G>  -> std::variant<E, F, G>
///   error_union<>                       -> never
template <class... Es>
using error_union = typename impl::error_union_make<typename impl::error_union_fold<impl::type_list<>, Es...>::type>::type;

namespace impl
{
template <class T>
constexpr bool is_success_tag = false;
template <class T>
constexpr bool is_success_tag<success_t<T>> = true;

template <class T>
constexpr bool is_failure_tag = false;
template <class E>
constexpr bool is_failure_tag<failure_t<E>> = true;

/// Converts an error into the (wider) error type W
template <class W, class E>
W widen_error(E&& e)
{
    using D = std::remove_cvref_t<E>;

    if constexpr (std::is_same_v<D, W>)
        return W(sc::forward<E>(e));
    else if constexpr (std::is_same_v<D, never>)
        SC_BUILTIN_UNREACHABLE;
    else if constexpr (impl::is_variant<D>)
        return std::visit([](auto&& alt) -> W { return impl::widen_error<W>(sc::forward<decltype(alt)>(alt)); }, sc::forward<E>(e));
    else
        return W(std::in_place_type<D>, sc::forward<E>(e));
}

/// Inline storage for either a T or an E, the active member is tracked by result
template <class T, class E>
union result_storage
{
    char _dummy;
    T value;
    E error;

    constexpr result_storage() : _dummy() {}

    ~result_storage()
        requires(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>)
    = default;
    ~result_storage()
        requires(!std::is_trivially_destructible_v<T> || !std::is_trivially_destructible_v<E>)
    {
    }
};
} // namespace impl
} // namespace sc

// =========================================================================================================
// result
// =========================================================================================================

/// Sum type representing either a success value T or an error value E
/// Used for operations that can fail with detailed error information
///
/// Combinators never modify the result they are called on. Each one returns a new result
/// (or option), except inspect(), inspect_err() and or_() which hand back the object they were called on.
/// Called on an rvalue, combinators move payloads out instead of copying them.
///
/// After a move, the moved-from result keeps its variant and holds a moved-from payload.
/// Trivially copyable when both T and E are trivially copyable.
template <class T, class E>
struct sc::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not support reference types");

    using value_type = T;
    using error_type = E;

    // construction
public:
    result() = delete;

    /// Success from a value convertible to T; conditionally explicit.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, result> && !impl::is_result<std::remove_cvref_t<U>>
                 && !impl::is_success_tag<std::remove_cvref_t<U>> && !impl::is_failure_tag<std::remove_cvref_t<U>>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) result(U&& value) : _is_success(true) // NOLINT
    {
        new (sc::placement_new, &_storage.value) T(sc::forward<U>(value));
    }

    template <class U>
        requires std::is_constructible_v<T, U&&>
    result(success_t<U>&& s) : _is_success(true) // NOLINT
    {
        new (sc::placement_new, &_storage.value) T(sc::move(s.value));
    }
    template <class U>
        requires std::is_constructible_v<T, U const&>
    result(success_t<U> const& s) : _is_success(true) // NOLINT
    {
        new (sc::placement_new, &_storage.value) T(s.value);
    }

    template <class F>
        requires std::is_constructible_v<E, F&&>
    result(failure_t<F>&& f) : _is_success(false) // NOLINT
    {
        new (sc::placement_new, &_storage.error) E(sc::move(f.error));
    }
    template <class F>
        requires std::is_constructible_v<E, F const&>
    result(failure_t<F> const& f) : _is_success(false) // NOLINT
    {
        new (sc::placement_new, &_storage.error) E(f.error);
    }

    /// Converts from a result with different but compatible payload types
    template <class U, class F>
        requires(!(std::is_same_v<U, T> && std::is_same_v<F, E>) && std::is_constructible_v<T, U&&> && std::is_constructible_v<E, F &&>)
    explicit(!std::is_convertible_v<U, T> || !std::is_convertible_v<F, E>) result(result<U, F>&& rhs) // NOLINT
      : _is_success(rhs._is_success)
    {
        if (_is_success)
            new (sc::placement_new, &_storage.value) T(sc::move(rhs._storage.value));
        else
            new (sc::placement_new, &_storage.error) E(sc::move(rhs._storage.error));
    }
    template <class U, class F>
        requires(!(std::is_same_v<U, T> && std::is_same_v<F, E>) && std::is_constructible_v<T, U const&> && std::is_constructible_v<E, F const&>)
    explicit(!std::is_convertible_v<U const&, T> || !std::is_convertible_v<F const&, E>) result(result<U, F> const& rhs) // NOLINT
      : _is_success(rhs._is_success)
    {
        if (_is_success)
            new (sc::placement_new, &_storage.value) T(rhs._storage.value);
        else
            new (sc::placement_new, &_storage.error) E(rhs._storage.error);
    }

    // trivial copy/move/destroy - defaulted when T and E allow bitwise operations
public:
    result(result&&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result(result const&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result& operator=(result&&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result& operator=(result const&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;

    ~result()
        requires(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>)
    = default;

    // non-trivial copy/move/destroy
public:
    /// rhs keeps its variant and holds a moved-from payload afterwards
    result(result&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T> || !std::is_trivially_copyable_v<E>)
      : _is_success(rhs._is_success)
    {
        if (_is_success)
            new (sc::placement_new, &_storage.value) T(sc::move(rhs._storage.value));
        else
            new (sc::placement_new, &_storage.error) E(sc::move(rhs._storage.error));
    }

    result(result const& rhs)
        requires((!std::is_trivially_copyable_v<T> || !std::is_trivially_copyable_v<E>)
                 && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _is_success(rhs._is_success)
    {
        if (_is_success)
            new (sc::placement_new, &_storage.value) T(rhs._storage.value);
        else
            new (sc::placement_new, &_storage.error) E(rhs._storage.error);
    }

    /// Assigns in place if both sides hold the same variant, otherwise destroys and reconstructs
    result& operator=(result&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T> || !std::is_trivially_copyable_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (_is_success == rhs._is_success)
        {
            if (_is_success)
                _storage.value = sc::move(rhs._storage.value);
            else
                _storage.error = sc::move(rhs._storage.error);
        }
        else
        {
            impl_destroy();
            _is_success = rhs._is_success;
            if (_is_success)
                new (sc::placement_new, &_storage.value) T(sc::move(rhs._storage.value));
            else
                new (sc::placement_new, &_storage.error) E(sc::move(rhs._storage.error));
        }

        return *this;
    }

    result& operator=(result const& rhs)
        requires((!std::is_trivially_copyable_v<T> || !std::is_trivially_copyable_v<E>)
                 && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (_is_success == rhs._is_success)
        {
            if (_is_success)
                _storage.value = rhs._storage.value;
            else
                _storage.error = rhs._storage.error;
        }
        else
        {
            // copy first so a throwing copy leaves *this untouched
            *this = result(rhs);
        }

        return *this;
    }

    ~result()
        requires(!std::is_trivially_destructible_v<T> || !std::is_trivially_destructible_v<E>)
    {
        impl_destroy();
    }

    // queries and access
public:
    [[nodiscard]] bool is_success() const { return _is_success; }
    [[nodiscard]] bool is_failure() const { return !_is_success; }

    /// True if this is a success and pred(value) holds
    template <class P>
    [[nodiscard]] bool is_success_and(P&& pred) const
    {
        return _is_success && sc::invoke(sc::forward<P>(pred), _storage.value);
    }

    /// True if this is a failure and pred(error) holds
    template <class P>
    [[nodiscard]] bool is_failure_and(P&& pred) const
    {
        return !_is_success && sc::invoke(sc::forward<P>(pred), _storage.error);
    }

    /// Precondition: is_success() (checked only when SC_ASSERT is active)
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        SC_ASSERT(self._is_success, "attempted to access value of failed result");
        return static_cast<Self&&>(self)._storage.value;
    }

    /// Precondition: is_failure() (checked only when SC_ASSERT is active)
    template <class Self>
    [[nodiscard]] auto&& error(this Self&& self)
    {
        SC_ASSERT(!self._is_success, "attempted to access error of successful result");
        return static_cast<Self&&>(self)._storage.error;
    }

    // extraction
public:
    /// Returns the success value.
    /// On a failure this is a contract violation (checked in every build) whose message is the rendered error.
    template <class Self>
    [[nodiscard]] T unwrap(this Self&& self)
    {
        SC_ASSERTF_ALWAYS(self._is_success, "{}", sc::to_debug_string(self._storage.error));
        return static_cast<Self&&>(self)._storage.value;
    }

    /// Returns the error. On a success the message is the rendered value.
    template <class Self>
    [[nodiscard]] E unwrap_err(this Self&& self)
    {
        SC_ASSERTF_ALWAYS(!self._is_success, "{}", sc::to_debug_string(self._storage.value));
        return static_cast<Self&&>(self)._storage.error;
    }

    /// Like unwrap(), message is "<message>: <rendered error>"
    template <class Self>
    [[nodiscard]] T expect(this Self&& self, std::string_view message)
    {
        SC_ASSERTF_ALWAYS(self._is_success, "{}: {}", message, sc::to_debug_string(self._storage.error));
        return static_cast<Self&&>(self)._storage.value;
    }

    /// Like unwrap_err(), message is "<message>: <rendered value>"
    template <class Self>
    [[nodiscard]] E expect_err(this Self&& self, std::string_view message)
    {
        SC_ASSERTF_ALWAYS(!self._is_success, "{}: {}", message, sc::to_debug_string(self._storage.value));
        return static_cast<Self&&>(self)._storage.error;
    }

    template <class Self, class U>
    [[nodiscard]] T unwrap_or(this Self&& self, U&& default_value)
    {
        if (self._is_success)
            return static_cast<Self&&>(self)._storage.value;
        return static_cast<T>(sc::forward<U>(default_value));
    }

    /// on_err(error) is only invoked on a failure
    template <class Self, class F>
    [[nodiscard]] T unwrap_or_else(this Self&& self, F&& on_err)
    {
        if (self._is_success)
            return static_cast<Self&&>(self)._storage.value;
        return static_cast<T>(sc::invoke(sc::forward<F>(on_err), static_cast<Self&&>(self)._storage.error));
    }

    /// result<T, never> can only hold a value, so this never fails
    template <class Self>
        requires std::is_same_v<E, never>
    [[nodiscard]] T into_ok(this Self&& self)
    {
        return static_cast<Self&&>(self)._storage.value;
    }

    /// result<never, E> can only hold an error, so this never fails
    template <class Self>
        requires std::is_same_v<T, never>
    [[nodiscard]] E into_err(this Self&& self)
    {
        return static_cast<Self&&>(self)._storage.error;
    }

    // transformation
public:
    /// success(v) -> success(f(v)), failure(e) -> failure(e)
    template <class Self, class F>
    [[nodiscard]] auto map(this Self&& self, F&& f)
    {
        using U = std::remove_cvref_t<sc::invoke_result<F, decltype((static_cast<Self&&>(self)._storage.value))>>;
        static_assert(!std::is_void_v<U>, "map requires a function returning a value, use inspect for side effects");
        using R = result<U, E>;

        if (self._is_success)
            return R(success_t<U>{sc::invoke(sc::forward<F>(f), static_cast<Self&&>(self)._storage.value)});
        return R(failure_t<E>{static_cast<Self&&>(self)._storage.error});
    }

    /// success(v) -> success(v), failure(e) -> failure(f(e))
    template <class Self, class F>
    [[nodiscard]] auto map_err(this Self&& self, F&& f)
    {
        using G = std::remove_cvref_t<sc::invoke_result<F, decltype((static_cast<Self&&>(self)._storage.error))>>;
        static_assert(!std::is_void_v<G>, "map_err requires a function returning a value, use inspect_err for side effects");
        using R = result<T, G>;

        if (self._is_success)
            return R(success_t<T>{static_cast<Self&&>(self)._storage.value});
        return R(failure_t<G>{sc::invoke(sc::forward<F>(f), static_cast<Self&&>(self)._storage.error)});
    }

    /// success(v) -> success(f(v)), failure -> success(default_value)
    /// The result is always a success: defaulting wraps, it does not unwrap.
    template <class Self, class D, class F>
    [[nodiscard]] auto map_or(this Self&& self, D&& default_value, F&& f)
    {
        using U = std::remove_cvref_t<sc::invoke_result<F, decltype((static_cast<Self&&>(self)._storage.value))>>;
        using R = result<U, E>;

        if (self._is_success)
            return R(success_t<U>{sc::invoke(sc::forward<F>(f), static_cast<Self&&>(self)._storage.value)});
        return R(success_t<U>{static_cast<U>(sc::forward<D>(default_value))});
    }

    /// success(v) -> success(on_ok(v)), failure(e) -> success(on_err(e))
    template <class Self, class D, class F>
    [[nodiscard]] auto map_or_else(this Self&& self, D&& on_err, F&& on_ok)
    {
        using U = std::remove_cvref_t<sc::invoke_result<F, decltype((static_cast<Self&&>(self)._storage.value))>>;
        using R = result<U, E>;

        if (self._is_success)
            return R(success_t<U>{sc::invoke(sc::forward<F>(on_ok), static_cast<Self&&>(self)._storage.value)});
        return R(success_t<U>{static_cast<U>(sc::invoke(sc::forward<D>(on_err), static_cast<Self&&>(self)._storage.error))});
    }

    /// failure(e) if this is a failure, otherwise other.
    /// The error type is widened to error_union<E, F>.
    template <class U, class F>
    [[nodiscard]] result<U, error_union<E, F>> and_(result<U, F> other) const&
    {
        using W = error_union<E, F>;
        if (!_is_success)
            return failure_t<W>{impl::widen_error<W>(_storage.error)};
        if (!other._is_success)
            return failure_t<W>{impl::widen_error<W>(sc::move(other._storage.error))};
        return success_t<U>{sc::move(other._storage.value)};
    }
    template <class U, class F>
    [[nodiscard]] result<U, error_union<E, F>> and_(result<U, F> other) &&
    {
        using W = error_union<E, F>;
        if (!_is_success)
            return failure_t<W>{impl::widen_error<W>(sc::move(_storage.error))};
        if (!other._is_success)
            return failure_t<W>{impl::widen_error<W>(sc::move(other._storage.error))};
        return success_t<U>{sc::move(other._storage.value)};
    }

    /// Monadic bind: success(v) -> f(v), failure(e) -> failure(e).
    /// f must return a result<U, F>, the error type is widened to error_union<E, F>.
    template <class Self, class F>
    [[nodiscard]] auto and_then(this Self&& self, F&& f)
    {
        using R2 = std::remove_cvref_t<sc::invoke_result<F, decltype((static_cast<Self&&>(self)._storage.value))>>;
        static_assert(impl::is_result<R2>, "and_then requires a function returning an sc::result");
        using U = typename R2::value_type;
        using W = error_union<E, typename R2::error_type>;
        using R = result<U, W>;

        if (!self._is_success)
            return R(failure_t<W>{impl::widen_error<W>(static_cast<Self&&>(self)._storage.error)});

        auto next = R2(sc::invoke(sc::forward<F>(f), static_cast<Self&&>(self)._storage.value));
        if (next.is_failure())
            return R(failure_t<W>{impl::widen_error<W>(sc::move(next._storage.error))});
        return R(success_t<U>{sc::move(next._storage.value)});
    }

    /// result<result<T, E>, E> -> result<T, E>, removing one level of nesting
    template <class Self>
        requires(impl::is_result<T> && std::is_same_v<typename T::error_type, E>)
    [[nodiscard]] T flatten(this Self&& self)
    {
        if (self._is_success)
            return static_cast<Self&&>(self)._storage.value;
        return T(failure_t<E>{static_cast<Self&&>(self)._storage.error});
    }

    /// Calls f(value) on a success and returns this result unchanged.
    /// On an lvalue, the returned reference is *this.
    template <class F>
    result const& inspect(F&& f) const&
    {
        if (_is_success)
            sc::invoke(sc::forward<F>(f), _storage.value);
        return *this;
    }
    template <class F>
    result inspect(F&& f) &&
    {
        if (_is_success)
            sc::invoke(sc::forward<F>(f), std::as_const(_storage.value));
        return sc::move(*this);
    }

    /// Calls f(error) on a failure and returns this result unchanged.
    template <class F>
    result const& inspect_err(F&& f) const&
    {
        if (!_is_success)
            sc::invoke(sc::forward<F>(f), _storage.error);
        return *this;
    }
    template <class F>
    result inspect_err(F&& f) &&
    {
        if (!_is_success)
            sc::invoke(sc::forward<F>(f), std::as_const(_storage.error));
        return sc::move(*this);
    }

    /// *this on a success, otherwise other.
    /// With an lvalue other the returned reference aliases either *this or other.
    [[nodiscard]] result const& or_(result const& other) const& { return _is_success ? *this : other; }
    [[nodiscard]] result or_(result&& other) const&
    {
        if (_is_success)
            return *this;
        return sc::move(other);
    }
    [[nodiscard]] result or_(result other) &&
    {
        if (_is_success)
            return sc::move(*this);
        return other;
    }

    /// This result on a success, otherwise f(error). f must return a result<T, F>.
    template <class Self, class F>
    [[nodiscard]] auto or_else(this Self&& self, F&& f)
    {
        using R2 = std::remove_cvref_t<sc::invoke_result<F, decltype((static_cast<Self&&>(self)._storage.error))>>;
        static_assert(impl::is_result<R2>, "or_else requires a function returning an sc::result");
        using R = result<T, typename R2::error_type>;

        if (self._is_success)
            return R(success_t<T>{static_cast<Self&&>(self)._storage.value});
        return R(sc::invoke(sc::forward<F>(f), static_cast<Self&&>(self)._storage.error));
    }

    // bridges to sc::option
public:
    /// success(v) -> present(v), failure -> absent
    template <class Self>
    [[nodiscard]] option<T> ok(this Self&& self)
    {
        if (self._is_success)
            return option<T>(static_cast<Self&&>(self)._storage.value);
        return option<T>();
    }

    /// failure(e) -> present(e), success -> absent
    template <class Self>
    [[nodiscard]] option<E> err(this Self&& self)
    {
        if (!self._is_success)
            return option<E>(static_cast<Self&&>(self)._storage.error);
        return option<E>();
    }

    /// result<option<U>, E> -> option<result<U, E>>
    ///   success(absent)      -> absent
    ///   success(present(v))  -> present(success(v))
    ///   failure(e)           -> present(failure(e))
    template <class Self>
        requires impl::is_option<T>
    [[nodiscard]] auto transpose(this Self&& self)
    {
        using U = typename T::value_type;
        using R = result<U, E>;

        if (!self._is_success)
            return option<R>(R(failure_t<E>{static_cast<Self&&>(self)._storage.error}));

        auto&& inner = static_cast<Self&&>(self)._storage.value;
        if (inner.is_absent())
            return option<R>();
        return option<R>(R(success_t<U>{static_cast<decltype(inner)>(inner).value()}));
    }

    // error context (sc::any_error only)
public:
    /// Adds a context note to the error of a failure, a success passes through untouched
    template <class Self>
        requires std::is_same_v<E, any_error>
    [[nodiscard]] result with_context(this Self&& self, std::string message, sc::source_location site = sc::source_location::current())
    {
        if (self._is_success)
            return static_cast<Self&&>(self);

        auto error = any_error(static_cast<Self&&>(self)._storage.error);
        error.add_context(sc::move(message), site);
        return failure_t<any_error>{sc::move(error)};
    }

    /// Like with_context, but the message is only built (by calling f) on a failure
    template <class Self, class F>
        requires std::is_same_v<E, any_error>
    [[nodiscard]] result with_context_lazy(this Self&& self, F&& f, sc::source_location site = sc::source_location::current())
    {
        if (self._is_success)
            return static_cast<Self&&>(self);

        auto error = any_error(static_cast<Self&&>(self)._storage.error);
        error.add_context(std::string(sc::invoke(sc::forward<F>(f))), site);
        return failure_t<any_error>{sc::move(error)};
    }

    // comparison and debugging
public:
    /// Two results are equal if they hold the same variant with equal payloads
    [[nodiscard]] friend bool operator==(result const& lhs, result const& rhs)
        requires requires(T const& v, E const& e) {
            bool(v == v);
            bool(e == e);
        }
    {
        if (lhs._is_success != rhs._is_success)
            return false;
        if (lhs._is_success)
            return lhs._storage.value == rhs._storage.value;
        return lhs._storage.error == rhs._storage.error;
    }

    template <class U>
    [[nodiscard]] friend bool operator==(result const& lhs, success_t<U> const& rhs)
        requires requires(T const& v, U const& u) { bool(v == u); }
    {
        return lhs._is_success && lhs._storage.value == rhs.value;
    }

    template <class F>
    [[nodiscard]] friend bool operator==(result const& lhs, failure_t<F> const& rhs)
        requires requires(E const& e, F const& f) { bool(e == f); }
    {
        return !lhs._is_success && lhs._storage.error == rhs.error;
    }

    /// "success(<value>)" or "failure(<error>)", used by sc::to_debug_string
    [[nodiscard]] std::string to_string() const
    {
        if (_is_success)
            return "success(" + sc::to_debug_string(_storage.value) + ")";
        return "failure(" + sc::to_debug_string(_storage.error) + ")";
    }

    // members
private:
    template <class U, class F>
    friend struct result;

    impl::result_storage<T, E> _storage;
    bool _is_success;

    void impl_destroy()
    {
        if (_is_success)
            _storage.value.~T();
        else
            _storage.error.~E();
    }
};

// =========================================================================================================
// combine
// =========================================================================================================

namespace sc
{
/// Collects several results into one
///   all successes       -> success(std::tuple{v1, v2, ...}) in argument order
///   at least one failure -> the first failure from the left, later arguments are not inspected
/// The error type is error_union<E1, E2, ...>, combine() with no arguments is success(std::tuple<>{}).
///
/// Usage:
///   auto r = sc::combine(parse_int(a), parse_int(b), parse_name(c));
///   if (r.is_success())
///       auto [x, y, name] = r.unwrap();
template <class... Rs>
    requires(impl::is_result<std::remove_cvref_t<Rs>> && ...)
[[nodiscard]] auto combine(Rs&&... results)
{
    using T = std::tuple<typename std::remove_cvref_t<Rs>::value_type...>;
    using E = error_union<typename std::remove_cvref_t<Rs>::error_type...>;
    using R = result<T, E>;

    if constexpr (sizeof...(Rs) == 0)
    {
        return R(success_t<T>{T()});
    }
    else
    {
        option<E> first_error;
        (void)((results.is_success() || (first_error = option<E>(impl::widen_error<E>(sc::forward<Rs>(results).error())), false)) && ...);

        if (first_error.is_present())
            return R(failure_t<E>{sc::move(first_error).unwrap()});
        return R(success_t<T>{T(sc::forward<Rs>(results).value()...)});
    }
}

/// Collects a range of result<T, E> into result<std::vector<T>, E>
/// Stops at the first failure and returns it, otherwise all values in range order.
template <std::ranges::input_range Range>
    requires impl::is_result<std::remove_cvref_t<std::ranges::range_value_t<Range>>>
[[nodiscard]] auto combine(Range&& results)
{
    using In = std::remove_cvref_t<std::ranges::range_value_t<Range>>;
    using T = typename In::value_type;
    using E = typename In::error_type;
    using R = result<std::vector<T>, E>;

    std::vector<T> values;
    for (auto&& r : results)
    {
        if (r.is_failure())
            return R(failure_t<E>{sc::forward<decltype(r)>(r).error()});
        values.push_back(sc::forward<decltype(r)>(r).value());
    }
    return R(success_t<std::vector<T>>{sc::move(values)});
}
} // namespace sc
