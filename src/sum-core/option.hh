#pragma once

#include <sum-core/assert.hh>
#include <sum-core/assertf.hh>
#include <sum-core/fwd.hh>
#include <sum-core/pair.hh>
#include <sum-core/to_debug_string.hh>
#include <sum-core/utility.hh>

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

/// Sentinel type used to represent the absent state of an option.
/// Construct as sc::absent to explicitly build, assign or compare against absent options.
/// Deliberately lacks a default constructor to avoid ambiguity in option<T> = {}.
struct sc::absent_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr absent_t(_ctor_tag) {}
};

namespace sc
{
/// The canonical instance of absent_t.
/// Usage: option<int> opt = sc::absent; or if (opt == sc::absent).
constexpr absent_t absent = absent_t{absent_t::_ctor_tag::tag};
} // namespace sc

/// Sum type representing either a present value of type T or nothing (T | absent).
///
/// Combinators never modify the option they are called on. Each one returns a new option
/// (or result), except inspect() and or_() which hand back the object they were called on.
/// Called on an rvalue, combinators move the payload out instead of copying it.
///
/// There is no operator* or operator->: payloads are reached through unwrap/expect (contract checked
/// in every build), unwrap_or/unwrap_or_else (total), or value() (checked only when SC_ASSERT is active).
///
/// Trivially copyable when T is trivially copyable.
template <class T>
struct sc::option
{
    static_assert(!std::is_reference_v<T>, "option<T&> is not supported, use option<T*> instead");
    static_assert(!std::is_same_v<std::remove_cv_t<T>, absent_t>, "option<absent_t> is not a meaningful type");

    using value_type = T;

    // construction
public:
    /// Default option is absent: is_present() == false.
    option() = default;

    /// Constructs an absent option from sc::absent.
    option(absent_t) {}

    /// Constructs a present option holding the given value; conditionally explicit.
    /// Forwarding constructor: perfect-forwards the value into internal storage.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, option> && !std::is_same_v<std::remove_cvref_t<U>, absent_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr option(U&& value) : _has_value(true) // NOLINT
    {
        new (sc::placement_new, &_storage.value) T(sc::forward<U>(value));
    }

    // trivial copy/move/destroy - defaulted when T allows bitwise operations
public:
    option(option&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    option(option const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    option& operator=(option&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    option& operator=(option const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~option()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy - custom implementation when T requires special handling
public:
    /// Move constructor for non-trivial T: move-constructs the value, rhs keeps a moved-from value.
    /// rhs stays present: an option never changes its variant behind the caller's back.
    option(option&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (sc::placement_new, &_storage.value) T(sc::move(rhs._storage.value));
    }

    option(option const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (sc::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Move assignment for non-trivial T: moves or constructs from rhs, handling all state combinations.
    /// Subobject self-move is safe: my_opt = sc::move(my_opt.value().sub_opt) works.
    option& operator=(option&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = sc::move(rhs._storage.value);
            else
                new (sc::placement_new, &_storage.value) T(sc::move(rhs._storage.value));

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    option& operator=(option const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (sc::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    ~option()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    [[nodiscard]] bool is_present() const { return _has_value; }
    [[nodiscard]] bool is_absent() const { return !_has_value; }

    /// Returns a reference to the held value, preserving the value category of the option itself.
    /// Precondition: is_present() == true (checked only when SC_ASSERT is active).
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        SC_ASSERT(self._has_value, "attempted to access value of absent option");
        return static_cast<Self&&>(self)._storage.value;
    }

    // extraction
public:
    /// Returns the held value.
    /// Calling this on an absent option is a contract violation, checked in every build.
    template <class Self>
    [[nodiscard]] T unwrap(this Self&& self)
    {
        SC_ASSERT_ALWAYS(self._has_value, "unwrap called on an absent option");
        return static_cast<Self&&>(self)._storage.value;
    }

    /// Like unwrap(), but the contract violation carries exactly the given message.
    template <class Self>
    [[nodiscard]] T expect(this Self&& self, std::string_view message)
    {
        SC_ASSERTF_ALWAYS(self._has_value, "{}", message);
        return static_cast<Self&&>(self)._storage.value;
    }

    template <class Self, class U>
    [[nodiscard]] T unwrap_or(this Self&& self, U&& default_value)
    {
        if (self._has_value)
            return static_cast<Self&&>(self)._storage.value;
        return static_cast<T>(sc::forward<U>(default_value));
    }

    /// on_absent is only invoked if this option is absent.
    template <class Self, class F>
    [[nodiscard]] T unwrap_or_else(this Self&& self, F&& on_absent)
    {
        if (self._has_value)
            return static_cast<Self&&>(self)._storage.value;
        return static_cast<T>(sc::invoke(sc::forward<F>(on_absent)));
    }

    // transformation
public:
    /// present(v) -> present(f(v)), absent -> absent. f is never invoked on an absent option.
    template <class Self, class F>
    [[nodiscard]] auto map(this Self&& self, F&& f)
    {
        using U = std::remove_cvref_t<sc::invoke_result<F, decltype((static_cast<Self&&>(self)._storage.value))>>;
        static_assert(!std::is_void_v<U>, "map requires a function returning a value, use inspect for side effects");

        if (self._has_value)
            return option<U>(sc::invoke(sc::forward<F>(f), static_cast<Self&&>(self)._storage.value));
        return option<U>();
    }

    /// present(v) -> present(f(v)), absent -> present(default_value).
    /// The result is always present: defaulting wraps, it does not unwrap.
    template <class Self, class U, class F>
    [[nodiscard]] auto map_or(this Self&& self, U&& default_value, F&& f)
    {
        using R = std::remove_cvref_t<sc::invoke_result<F, decltype((static_cast<Self&&>(self)._storage.value))>>;

        if (self._has_value)
            return option<R>(sc::invoke(sc::forward<F>(f), static_cast<Self&&>(self)._storage.value));
        return option<R>(static_cast<R>(sc::forward<U>(default_value)));
    }

    /// Like map_or, but the default is computed lazily: on_absent is only invoked if this option is absent.
    template <class Self, class D, class F>
    [[nodiscard]] auto map_or_else(this Self&& self, D&& on_absent, F&& f)
    {
        using R = std::remove_cvref_t<sc::invoke_result<F, decltype((static_cast<Self&&>(self)._storage.value))>>;

        if (self._has_value)
            return option<R>(sc::invoke(sc::forward<F>(f), static_cast<Self&&>(self)._storage.value));
        return option<R>(static_cast<R>(sc::invoke(sc::forward<D>(on_absent))));
    }

    /// Pattern match with the same wrapping policy as map_or:
    /// present(v) -> present(on_present(v)), absent -> present(absent_value).
    template <class Self, class F, class U>
    [[nodiscard]] auto match(this Self&& self, F&& on_present, U&& absent_value)
    {
        return static_cast<Self&&>(self).map_or(sc::forward<U>(absent_value), sc::forward<F>(on_present));
    }

    /// absent if this option is absent, otherwise second.
    template <class U>
    [[nodiscard]] option<U> and_(option<U> second) const
    {
        if (!_has_value)
            return {};
        return second;
    }

    /// Monadic bind: present(v) -> f(v), absent -> absent. f must return an option.
    template <class Self, class F>
    [[nodiscard]] auto and_then(this Self&& self, F&& f)
    {
        using R = std::remove_cvref_t<sc::invoke_result<F, decltype((static_cast<Self&&>(self)._storage.value))>>;
        static_assert(impl::is_option<R>, "and_then requires a function returning an sc::option");

        if (self._has_value)
            return R(sc::invoke(sc::forward<F>(f), static_cast<Self&&>(self)._storage.value));
        return R();
    }

    /// Keeps the value only if pred(value) holds.
    template <class Self, class P>
    [[nodiscard]] option filter(this Self&& self, P&& pred)
    {
        if (self._has_value && sc::invoke(sc::forward<P>(pred), std::as_const(self._storage.value)))
            return static_cast<Self&&>(self);
        return {};
    }

    /// option<option<U>> -> option<U>, removing one level of nesting.
    template <class Self>
        requires impl::is_option<T>
    [[nodiscard]] T flatten(this Self&& self)
    {
        if (self._has_value)
            return static_cast<Self&&>(self)._storage.value;
        return T();
    }

    /// Calls f(value) if present and returns this option unchanged.
    /// On an lvalue, the returned reference is *this.
    template <class F>
    option const& inspect(F&& f) const&
    {
        if (_has_value)
            sc::invoke(sc::forward<F>(f), _storage.value);
        return *this;
    }
    template <class F>
    option inspect(F&& f) &&
    {
        if (_has_value)
            sc::invoke(sc::forward<F>(f), std::as_const(_storage.value));
        return sc::move(*this);
    }

    /// *this if present, otherwise other.
    /// With an lvalue other the result aliases *this or other; a temporary other is returned by value.
    [[nodiscard]] option const& or_(option const& other) const& { return _has_value ? *this : other; }
    [[nodiscard]] option or_(option&& other) const&
    {
        if (_has_value)
            return *this;
        return sc::move(other);
    }
    [[nodiscard]] option or_(option other) &&
    {
        if (_has_value)
            return sc::move(*this);
        return other;
    }

    /// This option if present, otherwise f(). f must return an option<T>.
    template <class Self, class F>
    [[nodiscard]] option or_else(this Self&& self, F&& f)
    {
        static_assert(std::is_convertible_v<sc::invoke_result<F>, option>, "or_else requires a function returning an sc::option<T>");

        if (self._has_value)
            return static_cast<Self&&>(self);
        return sc::invoke(sc::forward<F>(f));
    }

    // combination
public:
    /// present(a).zip(present(b)) -> present(pair{a, b}), absent otherwise.
    /// This option is checked before other.
    template <class Self, class U>
    [[nodiscard]] option<sc::pair<T, U>> zip(this Self&& self, option<U> other)
    {
        if (!self._has_value)
            return {};
        if (!other._has_value)
            return {};
        return sc::pair<T, U>{static_cast<Self&&>(self)._storage.value, sc::move(other._storage.value)};
    }

    /// present(a).zip_with(present(b), f) -> present(f(a, b)), absent otherwise.
    /// This option is checked before other, f is only invoked if both are present.
    template <class Self, class U, class F>
    [[nodiscard]] auto zip_with(this Self&& self, option<U> other, F&& f)
    {
        using R = std::remove_cvref_t<sc::invoke_result<F, decltype((static_cast<Self&&>(self)._storage.value)), U&&>>;

        if (!self._has_value)
            return option<R>();
        if (!other._has_value)
            return option<R>();
        return option<R>(sc::invoke(sc::forward<F>(f), static_cast<Self&&>(self)._storage.value, sc::move(other._storage.value)));
    }

    /// option<pair-like<A, B>> -> pair{option<A>, option<B>}; both absent if this option is absent.
    template <class Self>
        requires requires { std::tuple_size<T>::value; } && (std::tuple_size<T>::value == 2)
    [[nodiscard]] auto unzip(this Self&& self)
    {
        using A = std::tuple_element_t<0, T>;
        using B = std::tuple_element_t<1, T>;
        using std::get;

        if (!self._has_value)
            return sc::pair<option<A>, option<B>>{option<A>(), option<B>()};

        auto&& v = static_cast<Self&&>(self)._storage.value;
        return sc::pair<option<A>, option<B>>{
            option<A>(get<0>(static_cast<decltype(v)>(v))),
            option<B>(get<1>(static_cast<decltype(v)>(v))),
        };
    }

    // bridges to sc::result
public:
    /// present(v) -> success(v), absent -> failure(error).
    template <class Self, class E>
    [[nodiscard]] result<T, std::decay_t<E>> ok_or(this Self&& self, E&& error)
    {
        using R = result<T, std::decay_t<E>>;
        if (self._has_value)
            return R(sc::success_t<T>{static_cast<Self&&>(self)._storage.value});
        return R(sc::failure_t<std::decay_t<E>>{sc::forward<E>(error)});
    }

    /// Like ok_or, but the error is computed lazily: f is only invoked if this option is absent.
    template <class Self, class F>
    [[nodiscard]] auto ok_or_else(this Self&& self, F&& f)
    {
        using E = std::remove_cvref_t<sc::invoke_result<F>>;
        using R = result<T, E>;
        if (self._has_value)
            return R(sc::success_t<T>{static_cast<Self&&>(self)._storage.value});
        return R(sc::failure_t<E>{sc::invoke(sc::forward<F>(f))});
    }

    /// option<result<U, E>> -> result<option<U>, E>
    ///   absent                -> success(absent)
    ///   present(success(v))   -> success(present(v))
    ///   present(failure(e))   -> failure(e)
    template <class Self>
        requires impl::is_result<T>
    [[nodiscard]] auto transpose(this Self&& self)
    {
        using U = typename T::value_type;
        using E = typename T::error_type;
        using R = result<option<U>, E>;

        if (!self._has_value)
            return R(sc::success_t<option<U>>{option<U>()});

        auto&& inner = static_cast<Self&&>(self)._storage.value;
        if (inner.is_failure())
            return R(sc::failure_t<E>{static_cast<decltype(inner)>(inner).error()});
        return R(sc::success_t<option<U>>{option<U>(static_cast<decltype(inner)>(inner).value())});
    }

    // comparison and debugging
public:
    /// Two options are equal if both are absent or both hold equal values.
    [[nodiscard]] friend bool operator==(option const& lhs, option const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// An option equals a value if it holds an equal value.
    [[nodiscard]] friend bool operator==(option const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(option const& lhs, absent_t) { return !lhs._has_value; }

    /// Deleted when T is not bool to prevent option<int> == true from compiling via implicit conversions.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    /// "present(<payload>)" or "absent", used by sc::to_debug_string.
    [[nodiscard]] std::string to_string() const
    {
        if (!_has_value)
            return "absent";
        return "present(" + sc::to_debug_string(_storage.value) + ")";
    }

    // members
private:
    template <class U>
    friend struct option;

    /// Value is constructed in-place when the option is present.
    sc::storage_for<T> _storage;

    /// True when _storage.value holds a live T object.
    bool _has_value = false;
};

namespace sc
{
/// Creates a present option, deducing T from the argument.
/// Usage: auto opt = sc::present(5);   // sc::option<int>
template <class T>
[[nodiscard]] constexpr option<std::decay_t<T>> present(T&& value)
{
    return option<std::decay_t<T>>(sc::forward<T>(value));
}

/// Bridges from nullable host representations: nullptr becomes absent, any other pointer is present.
template <class T>
[[nodiscard]] constexpr option<T*> from_nullable(T* ptr)
{
    if (ptr == nullptr)
        return {};
    return option<T*>(ptr);
}

/// std::nullopt becomes absent, any held value is present.
template <class T>
[[nodiscard]] constexpr option<T> from_nullable(std::optional<T> value)
{
    if (!value.has_value())
        return {};
    return option<T>(sc::move(*value));
}
} // namespace sc

// bridge operations need the complete result type
#include <sum-core/result.hh>
