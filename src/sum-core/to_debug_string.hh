#pragma once

#include <sum-core/fwd.hh>
#include <sum-core/to_string.hh>

#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility> // for tuple_size
#include <variant>

namespace sc
{
struct debug_string_config
{
    // not strict for now
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Best-effort, non-semantic, and intended only for diagnostics.
// This is what ends up in the messages of failed unwrap/expect calls.
//
// Strategy (in order):
//   - String-likes: wrap in double quotes "..." with escapes for quotes, backslash and control chars
//     a null char const* renders as nullptr
//   - char: wrap in single quotes '...' with the same escapes
//   - Use to_string(v) if available
//   - Use v.to_string() if available (sc::option, sc::result and sc::any_error provide one)
//   - std::variant: the active alternative
//   - For collections, recursively format elements as [v0, v1, ...]
//   - For tuple-likes, recursively format elements as (v0, v1, ...)
//   - Otherwise emit raw memory dump
//
// No stability, completeness, or user-facing guarantees.
// Output may change, be lossy, or depend on build/configuration.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
template <class T>
bool to_debug_string_append_elem(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";

    s += sc::to_debug_string(v, cfg);

    return true;
}
template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    using std::get;
    (void)(sc::impl::to_debug_string_append_elem(s, get<I>(v), cfg) && ...);
}

// appends c with escape sequences for control characters, backslash and the surrounding quote
inline void to_debug_string_append_escaped(std::string& s, char c, char quote)
{
    switch (c)
    {
    case '\0': s += "\\0"; return;
    case '\n': s += "\\n"; return;
    case '\r': s += "\\r"; return;
    case '\t': s += "\\t"; return;
    case '\v': s += "\\v"; return;
    case '\f': s += "\\f"; return;
    case '\b': s += "\\b"; return;
    case '\a': s += "\\a"; return;
    case '\\': s += "\\\\"; return;
    default: break;
    }

    if (c == quote)
    {
        s += '\\';
        s += c;
    }
    else if ((c >= 0 && c < 32) || c == 127) // other control characters
        s += std::format("\\x{:02X}", static_cast<unsigned char>(c));
    else // printable, including space and bytes of multi-byte utf-8 sequences
        s += c;
}

template <class T>
constexpr bool is_variant = false;
template <class... Ts>
constexpr bool is_variant<std::variant<Ts...>> = true;
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        if constexpr (std::is_pointer_v<T>)
        {
            if (v == nullptr)
                return "nullptr";
        }

        auto s = std::string("\"");
        for (char const c : std::string_view(v))
            sc::impl::to_debug_string_append_escaped(s, c, '\"');
        s += '\"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");
        if (static_cast<unsigned char>(v) >= 128) // a lone non-ascii byte
            s += std::format("\\x{:02X}", static_cast<unsigned char>(v));
        else
            sc::impl::to_debug_string_append_escaped(s, v, '\'');
        s += '\'';
        return s;
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (impl::is_variant<T>)
    {
        if (v.valueless_by_exception())
            return "<valueless variant>";
        return std::visit([&](auto const& alt) { return sc::to_debug_string(alt, cfg); }, v);
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string("[");
        for (auto&& e : v)
        {
            if (isize(s.size()) >= cfg.max_length)
            {
                s += ", ...";
                break;
            }

            if (s.size() > 1)
                s += ", ";
            s += sc::to_debug_string(e, cfg);
        }
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        sc::impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else
    {
        auto s = std::string("0x");
        auto const align = alignof(T);
        auto const p_v = (unsigned char const*)&v;
        for (size_t i = 0; i < sizeof(T); ++i)
        {
            if (i > 0 && i % align == 0)
                s += "_";
            s += std::format("{:02X}", p_v[i]);
        }
        return s;
    }
}
} // namespace sc
