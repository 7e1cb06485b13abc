#pragma once

#include <late-core/checked_cell.hh>
#include <late-core/fwd.hh>
#include <late-core/optional.hh>
#include <late-core/to_string.hh>
#include <late-core/unchecked_cell.hh>

#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility> // for tuple_size

namespace lc
{
struct debug_string_config
{
    // not strict for now
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Best-effort, non-semantic, and intended only for diagnostics.
//
// Strategy (in order):
//   - late-core types:
//       checked_cell    -> checked_cell(<value>) or checked_cell(<uninit>), never the raw storage
//       unchecked_cell  -> unchecked_cell(<value>), out of contract before initialization
//       optional        -> <value> or nullopt
//   - String-likes: wrap in double quotes "..." (never empty output)
//   - char: wrap in single quotes '...' with escape sequences for control/non-printable chars
//   - Use to_string(v) if available (lc::to_string for primitives, or via ADL)
//   - Use v.to_string() if available
//   - For collections, recursively format elements as [v0, v1, ...]
//   - For tuple-likes, recursively format elements as (v0, v1, ...)
//   - Otherwise emit raw memory dump
//
// No stability, completeness, or user-facing guarantees.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

template <class T>
[[nodiscard]] std::string to_debug_string(optional<T> const& v, debug_string_config const& cfg = {});

template <class T>
[[nodiscard]] std::string to_debug_string(unchecked_cell<T> const& v, debug_string_config const& cfg = {});

template <class T>
[[nodiscard]] std::string to_debug_string(checked_cell<T> const& v, debug_string_config const& cfg = {});

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

    s += lc::to_debug_string(v, cfg);

    return true;
}

template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    (void)(lc::impl::to_debug_string_append_elem(s, std::get<I>(v), cfg) && ...);
}

inline void append_hex_byte(std::string& s, unsigned char b)
{
    constexpr char digits[] = "0123456789ABCDEF";
    s += digits[b >> 4];
    s += digits[b & 0xF];
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(optional<T> const& v, debug_string_config const& cfg)
{
    if (!v.has_value())
        return "nullopt";

    return lc::to_debug_string(v.value(), cfg);
}

template <class T>
[[nodiscard]] std::string to_debug_string(unchecked_cell<T> const& v, debug_string_config const& cfg)
{
    auto s = std::string("unchecked_cell(");
    s += lc::to_debug_string(v.get_reference(), cfg);
    s += ')';
    return s;
}

template <class T>
[[nodiscard]] std::string to_debug_string(checked_cell<T> const& v, debug_string_config const& cfg)
{
    auto s = std::string("checked_cell(");
    if (auto const value = v.try_get_reference(); value.has_value())
        s += lc::to_debug_string(value.value(), cfg);
    else
        s += "<uninit>";
    s += ')';
    return s;
}

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        auto s = std::string("\"");
        s += std::string_view(v);
        s += '\"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");

        // Escape control and non-printable characters
        if (v == '\0')
            s += "\\0";
        else if (v == '\n')
            s += "\\n";
        else if (v == '\r')
            s += "\\r";
        else if (v == '\t')
            s += "\\t";
        else if (v == '\v')
            s += "\\v";
        else if (v == '\f')
            s += "\\f";
        else if (v == '\b')
            s += "\\b";
        else if (v == '\a')
            s += "\\a";
        else if (v == '\\')
            s += "\\\\";
        else if (v == '\'')
            s += "\\'";
        else if (v < 32 || v == 127) // Other control characters
        {
            s += "\\x";
            impl::append_hex_byte(s, static_cast<unsigned char>(v));
        }
        else // Printable characters (including space)
            s += v;

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
            s += lc::to_debug_string(e, cfg);
        }
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        lc::impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else
    {
        auto s = std::string("0x");
        auto const align = alignof(T);
        auto const p_v = reinterpret_cast<unsigned char const*>(&v);
        for (size_t i = 0; i < sizeof(T); ++i)
        {
            if (i > 0 && i % align == 0)
                s += "_";
            impl::append_hex_byte(s, p_v[i]);
        }
        return s;
    }
}
} // namespace lc
